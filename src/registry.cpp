#include "toolhost/registry.hpp"
#include "toolhost/error.hpp"
#include "toolhost/log.hpp"

#include <mutex>
#include <stdexcept>
#include <utility>

namespace toolhost {

bool CapabilityDescriptor::is_template() const noexcept {
    auto open = name.find('{');
    return open != std::string::npos && name.find('}', open) != std::string::npos;
}

// ---------- URI templates ----------

namespace {

struct TemplatePart {
    bool variable;
    std::string text;
};

std::vector<TemplatePart> parse_template(const std::string& tmpl) {
    std::vector<TemplatePart> parts;
    size_t pos = 0;
    while (pos < tmpl.size()) {
        size_t open = tmpl.find('{', pos);
        if (open == std::string::npos) {
            parts.push_back({false, tmpl.substr(pos)});
            break;
        }
        size_t close = tmpl.find('}', open);
        if (close == std::string::npos) {
            parts.push_back({false, tmpl.substr(pos)});
            break;
        }
        if (open > pos) parts.push_back({false, tmpl.substr(pos, open - pos)});
        parts.push_back({true, tmpl.substr(open + 1, close - open - 1)});
        pos = close + 1;
    }
    return parts;
}

} // anonymous namespace

std::vector<std::string> uri_template_variables(const std::string& uri_template) {
    std::vector<std::string> names;
    for (const auto& part : parse_template(uri_template)) {
        if (part.variable) names.push_back(part.text);
    }
    return names;
}

std::optional<nlohmann::json> match_uri_template(const std::string& uri_template,
                                                 const std::string& uri) {
    auto parts = parse_template(uri_template);
    nlohmann::json vars = nlohmann::json::object();
    size_t pos = 0;

    for (size_t i = 0; i < parts.size(); ++i) {
        const auto& part = parts[i];
        if (!part.variable) {
            if (uri.compare(pos, part.text.size(), part.text) != 0) return std::nullopt;
            pos += part.text.size();
            continue;
        }

        size_t end;
        if (i + 1 == parts.size()) {
            end = uri.size();
        } else {
            // Variables are adjacent only in malformed templates; the next
            // part is then another variable and we stop at one character.
            const auto& next = parts[i + 1];
            end = next.variable ? pos + 1 : uri.find(next.text, pos + 1);
            if (end == std::string::npos || end > uri.size()) return std::nullopt;
        }
        if (end <= pos) return std::nullopt;
        vars[part.text] = uri.substr(pos, end - pos);
        pos = end;
    }

    if (pos != uri.size()) return std::nullopt;
    return vars;
}

// ---------- CapabilityRegistry ----------

CapabilityRegistry::CapabilityRegistry(RegistrationPolicy policy)
    : policy_(policy) {
    for (auto& t : tables_) t = std::make_shared<Table>();
}

std::shared_ptr<const CapabilityRegistry::Table>
CapabilityRegistry::snapshot(Category category) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tables_[slot(category)];
}

DescriptorPtr CapabilityRegistry::add(Category category, CapabilityDescriptor descriptor) {
    if (descriptor.name.empty()) {
        throw std::invalid_argument("Capability name must not be empty");
    }
    if (!descriptor.handler) {
        throw std::invalid_argument("Capability '" + descriptor.name + "' has no handler");
    }

    auto entry = std::make_shared<CapabilityDescriptor>(std::move(descriptor));
    bool replaced = false;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        const Table& current = *tables_[slot(category)];

        auto existing = current.index.find(entry->name);
        if (existing != current.index.end()) {
            if (policy_ == RegistrationPolicy::Strict) {
                throw DuplicateNameError("Duplicate " + std::string(category_name(category))
                                         + " entry: " + entry->name);
            }
            replaced = true;
        }

        auto next = std::make_shared<Table>();
        next->ordered.reserve(current.ordered.size() + 1);
        for (const auto& d : current.ordered) {
            if (replaced && d->name == entry->name) continue;
            next->index[d->name] = next->ordered.size();
            next->ordered.push_back(d);
        }
        next->index[entry->name] = next->ordered.size();
        next->ordered.push_back(entry);
        tables_[slot(category)] = std::move(next);
    }

    log::logger()->debug("{} {} '{}'", replaced ? "replaced" : "registered",
                         category_name(category), entry->name);
    return entry;
}

DescriptorPtr CapabilityRegistry::lookup(Category category, const std::string& name) const {
    auto d = find(category, name);
    if (!d) {
        throw NotFoundError("Unknown " + std::string(category_name(category)) + " entry: " + name);
    }
    return d;
}

DescriptorPtr CapabilityRegistry::find(Category category, const std::string& name) const {
    auto table = snapshot(category);
    auto it = table->index.find(name);
    if (it == table->index.end()) return nullptr;
    return table->ordered[it->second];
}

std::optional<CapabilityRegistry::TemplateMatch>
CapabilityRegistry::match_template(const std::string& uri) const {
    auto table = snapshot(Category::Resource);
    for (const auto& d : table->ordered) {
        if (!d->is_template()) continue;
        if (auto vars = match_uri_template(d->name, uri)) {
            return TemplateMatch{d, std::move(*vars)};
        }
    }
    return std::nullopt;
}

CapabilityRegistry::Listing CapabilityRegistry::list(Category category) const {
    return Listing(snapshot(category));
}

bool CapabilityRegistry::remove(Category category, const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const Table& current = *tables_[slot(category)];
    if (current.index.find(name) == current.index.end()) return false;

    auto next = std::make_shared<Table>();
    next->ordered.reserve(current.ordered.size());
    for (const auto& d : current.ordered) {
        if (d->name == name) continue;
        next->index[d->name] = next->ordered.size();
        next->ordered.push_back(d);
    }
    tables_[slot(category)] = std::move(next);
    return true;
}

size_t CapabilityRegistry::size(Category category) const {
    return snapshot(category)->ordered.size();
}

} // namespace toolhost
