#pragma once

#include "docprint/page.h"
#include <json/json.h>
#include <string>

namespace docprint {

/// JSON form of an artifact:
/// {"pageWidthMm":..,"pageHeightMm":..,"pages":[{"index":1,"instructions":[..]}]}
Json::Value artifactToJson(const OutputArtifact& artifact);

/// Compact serialization of artifactToJson. Identical artifacts give
/// byte-identical strings.
std::string serializeArtifact(const OutputArtifact& artifact);

} // namespace docprint
