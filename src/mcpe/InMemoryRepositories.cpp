//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryRepositories.cpp
// Purpose: In-memory repository implementations keyed by uri/name/id, listing in insertion order
//==========================================================================================================

#include <algorithm>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "mcpe/InMemoryRepositories.hpp"
#include "mcpe/errors/Errors.h"

namespace mcpe {

namespace {

// Keyed store that remembers first-insertion order. Replacing an entry keeps its position.
template <typename T>
class OrderedStore {
public:
    std::optional<T> get(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = items.find(key);
        if (it == items.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<T> list() const {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<T> out;
        out.reserve(order.size());
        for (const auto& key : order) {
            out.push_back(items.at(key));
        }
        return out;
    }

    void put(const std::string& key, const T& item) {
        std::lock_guard<std::mutex> lock(mutex);
        auto [it, inserted] = items.insert_or_assign(key, item);
        (void)it;
        if (inserted) {
            order.push_back(key);
        }
    }

    void erase(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex);
        if (items.erase(key) > 0) {
            order.erase(std::remove(order.begin(), order.end(), key), order.end());
        }
    }

private:
    mutable std::mutex mutex;
    std::vector<std::string> order;
    std::unordered_map<std::string, T> items;
};

void requireKey(const std::string& key, const char* field) {
    if (key.empty()) {
        throw errors::ValidationError(field, "must not be empty");
    }
}

} // namespace

//////////////////////////////////////////// Resources ////////////////////////////////////////////
class InMemoryResourceRepository::Impl {
public:
    OrderedStore<Resource> store;
};

InMemoryResourceRepository::InMemoryResourceRepository() : pImpl(std::make_unique<Impl>()) {}
InMemoryResourceRepository::~InMemoryResourceRepository() = default;

Resource InMemoryResourceRepository::GetResource(const std::string& uri) {
    auto r = pImpl->store.get(uri);
    if (!r.has_value()) {
        throw errors::ResourceNotFound(uri);
    }
    return r.value();
}

std::vector<Resource> InMemoryResourceRepository::ListResources() {
    return pImpl->store.list();
}

void InMemoryResourceRepository::AddResource(const Resource& resource) {
    requireKey(resource.uri, "uri");
    pImpl->store.put(resource.uri, resource);
}

void InMemoryResourceRepository::DeleteResource(const std::string& uri) {
    pImpl->store.erase(uri);
}

//////////////////////////////////////////// Tools ////////////////////////////////////////////
class InMemoryToolRepository::Impl {
public:
    OrderedStore<Tool> store;
};

InMemoryToolRepository::InMemoryToolRepository() : pImpl(std::make_unique<Impl>()) {}
InMemoryToolRepository::~InMemoryToolRepository() = default;

Tool InMemoryToolRepository::GetTool(const std::string& name) {
    auto t = pImpl->store.get(name);
    if (!t.has_value()) {
        throw errors::ToolNotFound(name);
    }
    return t.value();
}

std::vector<Tool> InMemoryToolRepository::ListTools() {
    return pImpl->store.list();
}

void InMemoryToolRepository::AddTool(const Tool& tool) {
    requireKey(tool.name, "name");
    pImpl->store.put(tool.name, tool);
}

void InMemoryToolRepository::DeleteTool(const std::string& name) {
    pImpl->store.erase(name);
}

//////////////////////////////////////////// Prompts ////////////////////////////////////////////
class InMemoryPromptRepository::Impl {
public:
    OrderedStore<Prompt> store;
};

InMemoryPromptRepository::InMemoryPromptRepository() : pImpl(std::make_unique<Impl>()) {}
InMemoryPromptRepository::~InMemoryPromptRepository() = default;

Prompt InMemoryPromptRepository::GetPrompt(const std::string& name) {
    auto p = pImpl->store.get(name);
    if (!p.has_value()) {
        throw errors::PromptNotFound(name);
    }
    return p.value();
}

std::vector<Prompt> InMemoryPromptRepository::ListPrompts() {
    return pImpl->store.list();
}

void InMemoryPromptRepository::AddPrompt(const Prompt& prompt) {
    requireKey(prompt.name, "name");
    pImpl->store.put(prompt.name, prompt);
}

void InMemoryPromptRepository::DeletePrompt(const std::string& name) {
    pImpl->store.erase(name);
}

//////////////////////////////////////////// Sessions ////////////////////////////////////////////
class InMemorySessionRepository::Impl {
public:
    OrderedStore<ClientSession> store;
};

InMemorySessionRepository::InMemorySessionRepository() : pImpl(std::make_unique<Impl>()) {}
InMemorySessionRepository::~InMemorySessionRepository() = default;

ClientSession InMemorySessionRepository::GetSession(const std::string& id) {
    auto s = pImpl->store.get(id);
    if (!s.has_value()) {
        throw errors::SessionNotFound(id);
    }
    return s.value();
}

std::vector<ClientSession> InMemorySessionRepository::ListSessions() {
    return pImpl->store.list();
}

void InMemorySessionRepository::AddSession(const ClientSession& session) {
    requireKey(session.id, "id");
    pImpl->store.put(session.id, session);
}

void InMemorySessionRepository::DeleteSession(const std::string& id) {
    pImpl->store.erase(id);
}

} // namespace mcpe
