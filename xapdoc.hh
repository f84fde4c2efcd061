//  XAPDOC  Layered XAP definition merger & documentation generator
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the xapdoc authors
#pragma once

#include "xapdoc/assembler.hh"
#include "xapdoc/config.hh"
#include "xapdoc/error.hh"
#include "xapdoc/generator.hh"
#include "xapdoc/io.hh"
#include "xapdoc/merger.hh"
#include "xapdoc/node.hh"
#include "xapdoc/renderers.hh"
#include "xapdoc/version.hh"
