#include "engine/Fingerprint.hpp"

#include <doctest/doctest.h>

using namespace folio::engine;

TEST_CASE("fingerprint ignores margins for e-reader formats")
{
    ConversionSettings settings;
    settings.format = OutputFormat::Epub;
    settings.profile = "kindle-basic";
    settings.margins = "1in";
    auto first = configuration_fingerprint(fingerprint_inputs(settings));
    settings.margins = "2in";
    CHECK(configuration_fingerprint(fingerprint_inputs(settings)) == first);

    settings.profile = "kindle-large";
    CHECK(configuration_fingerprint(fingerprint_inputs(settings)) != first);
}

TEST_CASE("fingerprint tracks every PDF-relevant input")
{
    ConversionSettings settings;
    auto base = configuration_fingerprint(fingerprint_inputs(settings));
    CHECK(base.size() == 64);
    CHECK(configuration_fingerprint(fingerprint_inputs(settings)) == base);

    auto margins = settings;
    margins.margins = "2in 0.75in";
    CHECK(configuration_fingerprint(fingerprint_inputs(margins)) != base);

    auto width = settings;
    width.max_width = PercentOf{80.0};
    CHECK(configuration_fingerprint(fingerprint_inputs(width)) != base);

    auto height = settings;
    height.max_height = Pixels{1000};
    CHECK(configuration_fingerprint(fingerprint_inputs(height)) != base);

    // Run-shaping switches never change the artifact.
    auto shaping = settings;
    shaping.max_workers = 1;
    shaping.parallel = false;
    shaping.save_html = true;
    CHECK(configuration_fingerprint(fingerprint_inputs(shaping)) == base);
}

TEST_CASE("canonical text is length-prefixed")
{
    FingerprintInputs a;
    a.profile = "a;b";
    FingerprintInputs b;
    b.profile = "a";
    b.margins = "b";
    CHECK(canonical_fingerprint_text(a) != canonical_fingerprint_text(b));
    CHECK(canonical_fingerprint_text(a).starts_with("folio-fingerprint/1;"));
}
