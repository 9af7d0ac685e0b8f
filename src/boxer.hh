//
// NANBOX-CC
//

#pragma once

#include <string_view>

#include "decoder.hh"
#include "encoder.hh"
#include "layout.hh"
#include "manifest.hh"
#include "options.hh"

namespace nanbox {

/**
 * @brief Owns the layout of one manifest and boxes values through it.
 *
 * The layout is built in the constructor and is read-only afterwards, so a
 * Boxer may be shared between threads. Throws LayoutError if the manifest
 * cannot be laid out.
 */
class Boxer {
  public:
    Boxer(const Manifest &manifest, const Options &opt);

    [[nodiscard]] const Layout &get_layout() const { return layout; }

    BoxStatus encode(size_t variant, const Scalar &value, Word *out) const;
    BoxStatus encode(std::string_view name, const Scalar &value, Word *out) const;

    [[nodiscard]] Classified decode(Word word) const;

    void print(std::ostream &os, Word word) const;

  private:
    void traceEncode(size_t variant, const Scalar &value, BoxStatus status, Word word) const;

    const Options &options;
    Layout         layout;
};

} // namespace nanbox
