//
// NANBOX-CC
//

#include <set>

#include <fmt/core.h>

#include "layout.hh"

namespace nanbox {

static int declaredWidth(const VariantDecl &decl) {
    switch (decl.kind) {
    case PayloadKind::FLOAT64:
    case PayloadKind::UNIT:
        return 0;
    case PayloadKind::BOOL:
        return 1;
    case PayloadKind::SIGNED_INT:
    case PayloadKind::UNSIGNED_INT:
    case PayloadKind::ADDRESS:
        return decl.width;
    }
    return 0; // Unreachable.
}

static bool validWidth(const VariantDecl &decl) {
    switch (decl.kind) {
    case PayloadKind::SIGNED_INT:
    case PayloadKind::UNSIGNED_INT:
        return decl.width > 0 && decl.width <= MAX_INT_WIDTH;
    case PayloadKind::ADDRESS:
        return decl.width > 0 && decl.width <= ADDRESS_BITS;
    default:
        return true;
    }
}

BoxStatus Layout::build(const Manifest &manifest, Layout *out, Diagnostics *diagnostics) {
    auto report = [diagnostics](size_t i, const std::string &name, const std::string &msg) {
        if (diagnostics != nullptr) {
            diagnostics->errorAt(i, name, msg);
        }
    };

    if (manifest.empty()) {
        if (diagnostics != nullptr) {
            diagnostics->error("manifest declares no variants");
        }
        return BoxStatus::EMPTY_MANIFEST;
    }

    Layout layout;
    layout.tagBits = tagWidth(manifest.size());
    if (layout.tagBits >= BOX_BITS) {
        if (diagnostics != nullptr) {
            diagnostics->error(fmt::format("{} variants cannot be tagged in {} bits",
                                           manifest.size(), BOX_BITS));
        }
        return BoxStatus::TOO_MANY_VARIANTS;
    }
    auto const capacity = layout.payload_bits();

    auto status = BoxStatus::OK;
    auto fail = [&status](BoxStatus s) {
        if (status == BoxStatus::OK) {
            status = s;
        }
    };

    for (size_t i = 0; i < manifest.size(); i++) {
        auto const &decl = manifest[i];
        if (!validWidth(decl)) {
            report(i, decl.name, fmt::format("width {} is not valid for this kind", decl.width));
            fail(BoxStatus::INVALID_WIDTH);
            continue;
        }
        auto width = declaredWidth(decl);
        if (width > capacity) {
            report(i, decl.name,
                   fmt::format("payload of {} bits exceeds the {} bits left by a {}-bit tag",
                               width, capacity, layout.tagBits));
            fail(BoxStatus::TOO_MANY_VARIANTS);
            continue;
        }
        if (decl.kind == PayloadKind::FLOAT64) {
            if (layout.floatIndex != npos) {
                report(i, decl.name,
                       fmt::format("second float variant, first is '{}'",
                                   manifest[layout.floatIndex].name));
                fail(BoxStatus::DUPLICATE_FLOAT);
                continue;
            }
            layout.floatIndex = i;
        }
        layout.variants.push_back({decl.name, decl.kind, width, static_cast<uint64_t>(i)});
    }
    if (status != BoxStatus::OK) {
        return status;
    }

    std::set<uint64_t> tags;
    for (auto const &v : layout.variants) {
        if (!tags.insert(v.tag).second) {
            throw std::logic_error(fmt::format("duplicate tag {} assigned to '{}'", v.tag, v.name));
        }
    }

    *out = std::move(layout);
    return BoxStatus::OK;
}

size_t Layout::find(std::string_view name) const {
    for (size_t i = 0; i < variants.size(); i++) {
        if (variants[i].name == name) {
            return i;
        }
    }
    return npos;
}

} // namespace nanbox
