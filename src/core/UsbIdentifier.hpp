#pragma once
#include <sampler-monitor/Types.hpp>
#include <optional>
#include <string>

namespace sampler_monitor {

// Canonical integer form of a USB vendor/product id.
//
// Windows reports ids as bare 4-digit hex ("2367"), other hosts as
// prefixed hex or decimal. Strings are trimmed and lowercased, then tried
// as "0x" hex, 4-character hex, decimal and finally bare hex. Apart from
// the "0x" form a leading sign is accepted, so "+12" is 12 and "-12" is -12.
std::optional<int> normalizeUsbId(const UsbIdValue& value);
std::optional<int> normalizeUsbId(const std::string& value);

std::string formatUsbId(const UsbIdValue& value);

}
