//
// NANBOX-CC
//

#pragma once

#include <iostream>

namespace nanbox {

struct Options {

    Options(std::ostream &out, std::ostream &err) : out(out), err(err) {}
    bool debug_layout{false};
    bool trace{false};
    bool silent{false};

    std::ostream &out;
    std::ostream &err;
};

} // namespace nanbox
