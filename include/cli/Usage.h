#pragma once

#include <string>

namespace pyrite::cli {

    std::string Usage();

} // namespace pyrite::cli
