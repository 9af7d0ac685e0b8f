//
// NANBOX-CC
//

#pragma once

#include <ostream>
#include <string_view>

#include "decoder.hh"
#include "layout.hh"
#include "scalar.hh"
#include "word.hh"

namespace nanbox {

std::string_view kindName(PayloadKind kind);

void printScalar(std::ostream &os, const Scalar &value);
void printClassified(std::ostream &os, const Layout &layout, const Classified &c);
void printWord(std::ostream &os, const Layout &layout, Word word);

void dumpLayout(std::ostream &os, const Layout &layout, std::string_view title);
void dumpWord(std::ostream &os, const Layout &layout, Word word);

} // namespace nanbox
