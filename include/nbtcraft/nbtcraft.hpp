#ifndef NBTCRAFT_NBTCRAFT_HPP
#define NBTCRAFT_NBTCRAFT_HPP

#include "error.hpp"
#include "log.hpp"
#include "tag.hpp"
#include "core.hpp"
#include "compression.hpp"
#include "region.hpp"
#include "snbt.hpp"
#include "world.hpp"

#endif
