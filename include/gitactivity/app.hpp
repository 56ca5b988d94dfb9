#pragma once

namespace gitactivity {

class App {
public:
  int run(int argc, char **argv);
};

} // namespace gitactivity
