
#pragma once

#include <string>

namespace shotform::dump_default_params
{
std::string brief() noexcept;
int run_main(int argc, char** argv);
} // namespace shotform::dump_default_params
