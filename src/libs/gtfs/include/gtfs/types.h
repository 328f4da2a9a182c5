#pragma once
#include <string>

namespace chinagtfs::gtfs
{
// GTFS field types, all written verbatim as UTF-8 text.
using Id = std::string;
using Text = std::string;
// ISO 4217, e.g. CNY
using CurrencyCode = std::string;
// IETF BCP 47, e.g. zh
using LanguageCode = std::string;
// IANA tz database name, e.g. Asia/Shanghai
using Timezone = std::string;

using Message = std::string;
}
