#include <regionmerge/app.hpp>

int main(int argc, char** argv) {
  return regionmerge::App{}.run(argc, argv);
}
