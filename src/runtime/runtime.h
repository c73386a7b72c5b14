#pragma once

// Everything a generated `<unit>.render.hpp` needs.
#include "runtime/ops.h"
#include "runtime/render_node.h"
#include "runtime/value.h"
