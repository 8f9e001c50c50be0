#include "engine/DiagramBlocks.hpp"
#include "engine/ImageFit.hpp"

#include <string>

#include <doctest/doctest.h>

using namespace folio::engine;

TEST_CASE("finds Mermaid and PlantUML fences in document order")
{
    std::string const markdown = "# Title\n"
                                 "\n"
                                 "```mermaid\n"
                                 "graph TD\n"
                                 "  A-->B\n"
                                 "```\n"
                                 "text\n"
                                 "```python\n"
                                 "print(1)\n"
                                 "```\n"
                                 "```PlantUML\n"
                                 "@startuml\nA -> B\n@enduml\n"
                                 "```\n";
    auto blocks = find_diagram_blocks(markdown);
    REQUIRE(blocks.size() == 2);

    CHECK(blocks[0].dialect == DiagramDialect::Mermaid);
    CHECK(blocks[0].source == "graph TD\n  A-->B");
    CHECK(markdown.substr(blocks[0].begin, 10) == "```mermaid");
    CHECK(markdown.substr(blocks[0].end - 3, 4) == "```\n");

    CHECK(blocks[1].dialect == DiagramDialect::PlantUml);
    CHECK(blocks[1].source == "@startuml\nA -> B\n@enduml");
    CHECK_FALSE(blocks[1].directive.no_resize);
    CHECK(blocks[1].directive.scale_percent == doctest::Approx(100.0));
}

TEST_CASE("CRLF line endings are accepted")
{
    std::string const markdown = "```mermaid\r\ngraph LR\r\n  A-->B\r\n```\r\n";
    auto blocks = find_diagram_blocks(markdown);
    REQUIRE(blocks.size() == 1);
    CHECK(blocks[0].source == "graph LR\r\n  A-->B");
}

TEST_CASE("fences not at a line start or unterminated are ignored")
{
    CHECK(find_diagram_blocks("inline ```mermaid\ngraph\n```\n").empty());
    CHECK(find_diagram_blocks("```mermaid\ngraph TD\n").empty());
    CHECK(find_diagram_blocks("```mermaid graph```\n").empty());
}

TEST_CASE("sizing comment directly above the fence is part of the block")
{
    std::string const markdown = "intro\n"
                                 "<!-- scale:50% -->\n"
                                 "```mermaid\n"
                                 "graph TD\n"
                                 "```\n"
                                 "<!-- no-resize -->\n"
                                 "```plantuml\n"
                                 "@startuml\n@enduml\n"
                                 "```\n";
    auto blocks = find_diagram_blocks(markdown);
    REQUIRE(blocks.size() == 2);
    CHECK(blocks[0].begin == 6);
    CHECK(blocks[0].directive.scale_percent == doctest::Approx(50.0));
    CHECK(blocks[1].directive.no_resize);

    auto replaced = replace_blocks(markdown, blocks, {"[one]", "[two]"});
    CHECK(replaced == "intro\n[one]\n[two]\n");
}

TEST_CASE("directive comments")
{
    auto keep = parse_directive_comment("<!-- no-resize -->");
    REQUIRE(keep);
    CHECK(keep->no_resize);

    auto scale = parse_directive_comment("  <!--scale:75%-->  ");
    REQUIRE(scale);
    CHECK_FALSE(scale->no_resize);
    CHECK(scale->scale_percent == doctest::Approx(75.0));

    auto zero = parse_directive_comment("<!-- scale:0% -->");
    REQUIRE(zero);
    CHECK(zero->scale_percent == doctest::Approx(100.0));

    CHECK_FALSE(parse_directive_comment("<!-- a note -->"));
    CHECK_FALSE(parse_directive_comment("<!-- scale:abc% -->"));
    CHECK_FALSE(parse_directive_comment("scale:50%"));
}

TEST_CASE("oversized scale directives fall back to full width")
{
    auto largest = parse_directive_comment("<!-- scale:1000% -->");
    REQUIRE(largest);
    CHECK(largest->scale_percent == doctest::Approx(1000.0));

    auto huge = parse_directive_comment("<!-- scale:4000000000% -->");
    REQUIRE(huge);
    CHECK(huge->scale_percent == doctest::Approx(100.0));

    auto overflow = parse_directive_comment("<!-- scale:99999999999999999999% -->");
    REQUIRE(overflow);
    CHECK(overflow->scale_percent == doctest::Approx(100.0));

    auto fitted = fit_display_size(ImageSize{800, 600}, *huge, 1680,
                                   Pixels{1680}, Pixels{2240});
    CHECK(fitted.width == 1680u);
    CHECK(fitted.height == 1260u);
}

TEST_CASE("dialect names")
{
    CHECK(dialect_name(DiagramDialect::Mermaid) == "Mermaid");
    CHECK(dialect_name(DiagramDialect::PlantUml) == "PlantUML");
}
