#pragma once

#include "types.hpp"
#include "value.hpp"
#include "schema.hpp"
#include "layout.hpp"
#include "decoder.hpp"
#include "nested.hpp"
#include "diff.hpp"
#include "reflection.hpp"
#include "registry.hpp"
#include "timeline.hpp"
#include "texel.hpp"
#include "report.hpp"
#include "layout_spec.hpp"
#include "dump_source.hpp"
