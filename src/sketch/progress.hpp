#pragma once

#include <cstddef>
#include <cstdio>
#include <string>

class ProgressMeter {
public:
  ProgressMeter(size_t total, const std::string &label = "Progress")
      : total_(total), count_(0), last_permille_(-1), label_(label) {
    tick(0);
  }

  void tick(size_t blocks) {
    count_ += blocks;
    print();
  }

  void tick_count(size_t count) {
    count_ = count;
    print();
  }

  void finalise() { fprintf(stderr, "%c%s: 100.0%%\n", 13, label_.c_str()); }

private:
  void print() {
    double progress =
        total_ > 0 ? count_ / static_cast<double>(total_) : 1.0;
    progress = progress > 1 ? 1 : progress;
    // Only redraw when the displayed value changes
    int permille = static_cast<int>(progress * 1000);
    if (permille != last_permille_) {
      last_permille_ = permille;
      fprintf(stderr, "%c%s: %.1lf%%", 13, label_.c_str(), progress * 100);
    }
  }

  size_t total_;
  volatile size_t count_;
  int last_permille_;
  std::string label_;
};
