#pragma once
#include <string>
#include "Types.h"

namespace posecast {

/* Best-effort JSON object loaders for the enrichment layers.
*  A missing file logs a warning, unreadable or non-object content logs an error;
*  both return an empty object. Neither ever throws.
*/
MetaMap loadCalibration(const std::string& path);
MetaMap loadStaticMetadata(const std::string& path);

} // namespace posecast
