#pragma once

/// Umbrella header for the fdkxx function development kit.

#include "version.hpp"
#include "error.hpp"
#include "text.hpp"
#include "content_type.hpp"
#include "codec/scalar.hpp"
#include "codec/json.hpp"
#include "codec/yaml.hpp"
#include "codec/xml.hpp"
#include "codec/plain.hpp"
#include "codec/form.hpp"
#include "coercion.hpp"
#include "logging.hpp"
#include "config.hpp"
#include "context.hpp"
#include "server.hpp"
#include "function.hpp"
