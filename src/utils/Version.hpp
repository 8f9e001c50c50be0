#pragma once

#ifndef FOLIO_BUILD_VERSION
#define FOLIO_BUILD_VERSION "0.0.0-dev"
#endif

namespace folio::version
{

inline constexpr char const kSemanticVersion[] = FOLIO_BUILD_VERSION;
inline constexpr char const kDisplayVersion[] = "Folio " FOLIO_BUILD_VERSION;
inline constexpr char const kUserAgentVersion[] = "Folio/" FOLIO_BUILD_VERSION;

} // namespace folio::version
