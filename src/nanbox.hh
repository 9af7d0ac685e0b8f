//
// NANBOX-CC
//

#pragma once

#include "boxed.hh"
#include "boxer.hh"
#include "canonical.hh"
#include "decoder.hh"
#include "encoder.hh"
#include "error.hh"
#include "layout.hh"
#include "manifest.hh"
#include "options.hh"
#include "printer.hh"
#include "scalar.hh"
#include "status.hh"
#include "word.hh"
