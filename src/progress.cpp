#include "progress.hpp"
#include <sstream>

namespace ghtp {

void ConsoleProgressReporter::page_fetched(int page, std::size_t fetched,
                                           long total) {
  std::ostringstream oss;
  oss << "Fetched page " << page << " (" << fetched << "/" << total
      << " repositories)";
  rewrite(oss.str());
}

void ConsoleProgressReporter::enriching(std::size_t index, std::size_t count,
                                        const std::string &name) {
  std::ostringstream oss;
  oss << "Enriching " << index << "/" << count << ": " << name;
  rewrite(oss.str());
}

void ConsoleProgressReporter::finish() {
  if (last_width_ > 0) {
    out_ << '\n';
    out_.flush();
    last_width_ = 0;
  }
}

void ConsoleProgressReporter::rewrite(const std::string &line) {
  out_ << '\r' << line;
  // Pad with spaces so a shorter line fully covers the previous one.
  if (line.size() < last_width_) {
    out_ << std::string(last_width_ - line.size(), ' ');
  }
  out_.flush();
  last_width_ = line.size();
}

} // namespace ghtp
