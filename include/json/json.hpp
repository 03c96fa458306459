//! # JSON Library
//!
//! Document model, parser and serializer used for the durable state file.
//!
//! ```cpp
//! #include "json/json.hpp"
//! using namespace pjsk::json;
//!
//! auto doc = parse_json(text);
//! if (is_ok(doc)) {
//!     std::cout << unwrap(doc).to_string_pretty() << "\n";
//! }
//! ```

#ifndef PJSK_JSON_HPP
#define PJSK_JSON_HPP

#include "json/json_error.hpp"
#include "json/json_parser.hpp"
#include "json/json_value.hpp"

#endif // PJSK_JSON_HPP
