//
// NANBOX-CC
//

#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "status.hh"

namespace nanbox {

class Diagnostics {
  public:
    Diagnostics(std::ostream &err) : err(err){};

    void errorAt(size_t variant, std::string_view name, std::string_view message);
    void error(std::string_view message);

    void reset() {
        hadError = false;
        errorCount = 0;
    }

    bool hadError{false};
    int  errorCount{0};

  private:
    std::ostream &err;
};

// Thrown when a manifest cannot be laid out. Raised once, at integration.
class LayoutError : public std::runtime_error {
  public:
    LayoutError(BoxStatus status, const std::string &what)
        : std::runtime_error(what), status(status){};

    [[nodiscard]] BoxStatus get_status() const { return status; }

  private:
    BoxStatus status;
};

} // namespace nanbox
