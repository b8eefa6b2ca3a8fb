//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace vellum::publish::detail {

inline constexpr std::string_view kPipelineConfigSchema = R"({
"$schema": "http://json-schema.org/draft-07/schema#",
"title": "Vellum Pipeline Configuration",
"type": "object",
"additionalProperties": false,
"required": ["keys", "paths"],
"properties": {
    "keys": {
        "type": "object",
        "additionalProperties": {
            "$ref": "#/definitions/key"
        }
    },
    "paths": {
        "type": "object",
        "additionalProperties": {
            "$ref": "#/definitions/path"
        }
    },
    "publish": {
        "$ref": "#/definitions/publish"
    },
    "path_mappings": {
        "type": "array",
        "items": {
            "$ref": "#/definitions/path_mapping"
        }
    }
},
"definitions": {
    "key": {
        "type": "object",
        "additionalProperties": false,
        "required": ["type"],
        "properties": {
            "type": {
                "type": "string",
                "enum": ["str", "int"]
            },
            "filter_by": {
                "type": "string",
                "enum": ["alphanumeric"]
            },
            "format_spec": {
                "type": "string",
                "pattern": "^0[1-9][0-9]?$"
            },
            "alias": {
                "type": "string",
                "minLength": 1
            },
            "choices": {
                "type": "array",
                "items": {
                    "type": ["string", "integer"]
                }
            },
            "default": {
                "type": ["string", "integer"]
            }
        }
    },
    "path": {
        "oneOf": [
            {
                "type": "string",
                "minLength": 1
            },
            {
                "type": "object",
                "additionalProperties": false,
                "required": ["definition"],
                "properties": {
                    "definition": {
                        "type": "string",
                        "minLength": 1
                    },
                    "base": {
                        "type": "string",
                        "minLength": 1
                    }
                }
            }
        ]
    },
    "string_map": {
        "type": "object",
        "additionalProperties": {
            "type": "string",
            "minLength": 1
        }
    },
    "publish": {
        "type": "object",
        "additionalProperties": false,
        "properties": {
            "templates": {
                "$ref": "#/definitions/string_map"
            },
            "fields": {
                "$ref": "#/definitions/string_map"
            },
            "publish_types": {
                "$ref": "#/definitions/string_map"
            },
            "preset_prefix": {
                "type": "string",
                "minLength": 1
            },
            "io_timeout_ms": {
                "type": "integer",
                "minimum": 1
            },
            "copy_workers": {
                "type": "integer",
                "minimum": 1
            },
            "single_slot_per_map": {
                "type": "boolean"
            }
        }
    },
    "path_mapping": {
        "type": "object",
        "additionalProperties": false,
        "required": ["unc_prefix", "mapped_drive_prefix"],
        "properties": {
            "unc_prefix": {
                "type": "string"
            },
            "mapped_drive_prefix": {
                "type": "string"
            }
        }
    }
}
})";

} // namespace vellum::publish::detail
