#pragma once

// Codec
#include "xdr.hpp"

// MDA records
#include "mda.hpp"

// Ambient
#include "config.hpp"
#include "log.hpp"
#include "settings.hpp"
