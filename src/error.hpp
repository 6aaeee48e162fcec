#pragma once

#include <recfetch/result.hpp>
#include <system_error>

namespace recfetch {

const std::error_category &recfetch_category();

}  // namespace recfetch
