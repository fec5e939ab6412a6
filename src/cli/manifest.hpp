//! # Class Manifest
//!
//! JSON description of the classes to expand, produced by the host
//! framework's reflection layer.
//!
//! ```json
//! {
//!   "hierarchy": {"UsersController": "Controller"},
//!   "classes": [{
//!     "name": "UsersController", "file": "users.php", "line": 3,
//!     "doc": "/** !Prefix users/ */",
//!     "properties": [{"name": "db", "line": 5, "doc": "..."}],
//!     "methods": [{"name": "index", "line": 9, "doc": "/** !Route GET, list */"}]
//!   }]
//! }
//! ```
//!
//! `hierarchy` maps each class to its direct parent. Every field except the
//! class and member `name` is optional.

#pragma once

#include "annotation/expander.hpp"
#include "annotation/target.hpp"
#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace notate::cli {

struct Manifest {
    annotation::StaticClassHierarchy hierarchy;
    std::vector<annotation::ClassSource> classes;
};

/// Parses and checks a manifest. Errors name the offending JSON path.
[[nodiscard]] auto load_manifest(std::string_view json_text) -> Result<Manifest, std::string>;

} // namespace notate::cli
