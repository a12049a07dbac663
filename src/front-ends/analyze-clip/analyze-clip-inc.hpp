
#pragma once

#include <string>

namespace shotform::analyze_clip_main
{
std::string brief() noexcept;
int run_main(int argc, char** argv);
} // namespace shotform::analyze_clip_main
