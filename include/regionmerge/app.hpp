#pragma once
#include <iosfwd>

#include <regionmerge/finder.hpp>

namespace regionmerge {

// Prints the [Y/n] prompt and reads one line; "y" or "yes" in any case accepts.
bool confirm_from_stream(std::istream& in, std::ostream& out, const DimensionPlan& plan);

struct App {
  int run(int argc, char** argv);
};

} // namespace regionmerge
