#pragma once

/**
 * \file Node.hpp
 * \brief Generic document tree shared by every SchemaKit component.
 *
 * OpenAPI documents are read into one recursive value type: an
 * insertion-ordered mapping, a sequence, a string, a number, a boolean or
 * null. nlohmann::ordered_json carries an explicit type tag
 * (Node::value_t) per value, which the transform passes switch on.
 */

#include <nlohmann/json.hpp>

namespace SchemaKit {

/// Document tree node. Objects keep the key order of the source document.
using Node = nlohmann::ordered_json;

} // namespace SchemaKit
