#pragma once

#include <string>
#include <typeinfo>

namespace ignyx {

// Human readable name of a type, as used in debug error reports.
std::string DemangledName(const std::type_info& typeInfo);

}  // namespace ignyx
