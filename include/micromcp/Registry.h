//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Registry.h
// Purpose: Insertion-ordered tool and resource registries (pure data + lookup)
//==========================================================================================================

#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "micromcp/Protocol.h"

namespace micromcp {

//==========================================================================================================
// OrderedRegistry
// Purpose: Keyed store preserving first-insertion order for listing.
// Notes:
//   - Register() replaces an existing entry in place (position kept, last registration wins).
//   - Lookup is exact and case-sensitive. There is no removal.
//==========================================================================================================
template <typename Descriptor, std::string Descriptor::*KeyField>
class OrderedRegistry {
public:
    void Register(Descriptor descriptor) {
        const std::string key = descriptor.*KeyField;
        auto it = index.find(key);
        if (it != index.end()) {
            entries[it->second] = std::move(descriptor);
            return;
        }
        index.emplace(key, entries.size());
        entries.push_back(std::move(descriptor));
    }

    const Descriptor* Find(const std::string& key) const {
        auto it = index.find(key);
        return it == index.end() ? nullptr : &entries[it->second];
    }

    const std::vector<Descriptor>& List() const { return entries; }
    std::size_t Size() const { return entries.size(); }
    bool Empty() const { return entries.empty(); }

    // JSON array of ToSchema() entries in registration order
    JSONValue ListSchemas() const {
        JSONValue::Array arr;
        arr.reserve(entries.size());
        for (const auto& e : entries) {
            arr.push_back(std::make_shared<JSONValue>(e.ToSchema()));
        }
        return JSONValue{arr};
    }

private:
    std::vector<Descriptor> entries;
    std::unordered_map<std::string, std::size_t> index;
};

using ToolRegistry = OrderedRegistry<Tool, &Tool::name>;
using ResourceRegistry = OrderedRegistry<Resource, &Resource::uri>;

} // namespace micromcp
