#include "app/ConverterMain.hpp"

int main(int argc, char *argv[])
{
    return folio::app::converter_main(argc, argv);
}
