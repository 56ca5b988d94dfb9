#include <gitactivity/app.hpp>

int main(int argc, char** argv) {
  return gitactivity::App{}.run(argc, argv);
}
