//
// NANBOX-CC
//

#include <sstream>

#include <fmt/core.h>

#include "boxer.hh"
#include "printer.hh"

namespace nanbox {

static Layout buildLayout(const Manifest &manifest, const Options &options) {
    std::ostringstream discard;
    Diagnostics        diagnostics(options.silent ? discard : options.err);
    Layout             layout;

    auto status = Layout::build(manifest, &layout, &diagnostics);
    if (status != BoxStatus::OK) {
        throw LayoutError(status, fmt::format("manifest cannot be laid out: {} ({} errors)",
                                              statusName(status), diagnostics.errorCount));
    }
    return layout;
}

Boxer::Boxer(const Manifest &manifest, const Options &opt)
    : options(opt), layout(buildLayout(manifest, opt)) {
    if (options.debug_layout) {
        dumpLayout(options.out, layout, "layout");
    }
}

BoxStatus Boxer::encode(size_t variant, const Scalar &value, Word *out) const {
    auto status = nanbox::encode(layout, variant, value, out);
    if (options.trace) {
        traceEncode(variant, value, status, status == BoxStatus::OK ? *out : Word());
    }
    return status;
}

BoxStatus Boxer::encode(std::string_view name, const Scalar &value, Word *out) const {
    auto variant = layout.find(name);
    if (variant == Layout::npos) {
        if (options.trace) {
            options.out << fmt::format("encode '{}': {}\n", name,
                                       statusName(BoxStatus::UNKNOWN_VARIANT));
        }
        return BoxStatus::UNKNOWN_VARIANT;
    }
    return encode(variant, value, out);
}

Classified Boxer::decode(Word word) const {
    auto c = nanbox::decode(layout, word);
    if (options.trace) {
        options.out << fmt::format("decode {:#018x} -> ", word.bits());
        printClassified(options.out, layout, c);
        options.out << '\n';
    }
    return c;
}

void Boxer::print(std::ostream &os, Word word) const {
    printWord(os, layout, word);
}

void Boxer::traceEncode(size_t variant, const Scalar &value, BoxStatus status,
                        Word word) const {
    auto const name = variant < layout.size() ? layout.get_variant(variant).name : "?";
    options.out << fmt::format("encode {} ", name);
    printScalar(options.out, value);
    if (status == BoxStatus::OK) {
        options.out << fmt::format(" -> {:#018x}\n", word.bits());
    } else {
        options.out << fmt::format(": {}\n", statusName(status));
    }
}

} // namespace nanbox
