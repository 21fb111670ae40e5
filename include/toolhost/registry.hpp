#pragma once
#include "schema.hpp"
#include "types.hpp"
#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolhost {

class RequestContext;

/// Type-erased handler shared by all categories. Receives validated
/// arguments; returns a success payload or an error envelope, or throws.
using Handler = std::function<InvocationResult(RequestContext& ctx,
                                               const nlohmann::json& arguments)>;

struct CapabilityDescriptor {
    std::string name;                       // tool/prompt name, resource URI or URI template
    std::optional<std::string> title;
    std::string description;
    std::vector<ParamSpec> params;
    std::optional<std::string> mime_type;   // resources only
    std::optional<nlohmann::json> annotations;
    Handler handler;

    /// Resource URI containing {variable} placeholders.
    bool is_template() const noexcept;
};

using DescriptorPtr = std::shared_ptr<const CapabilityDescriptor>;

enum class RegistrationPolicy {
    Strict,   // duplicate name -> DuplicateNameError
    Replace   // later registration wins and moves to the end of the listing
};

/// Names of the {variables} in a URI template, in order of appearance.
std::vector<std::string> uri_template_variables(const std::string& uri_template);

/// Match `uri` against a URI template. Each variable matches a non-empty run
/// up to the next literal; a trailing variable takes the rest of the URI.
std::optional<nlohmann::json> match_uri_template(const std::string& uri_template,
                                                 const std::string& uri);

/// Three independent name -> descriptor tables with stable registration
/// order. Writers copy-and-swap under an exclusive lock; readers grab the
/// current snapshot under a shared lock and never hold it afterwards.
class CapabilityRegistry {
    struct Table {
        std::vector<DescriptorPtr> ordered;
        std::unordered_map<std::string, size_t> index;
    };

public:
    /// Restartable view over one category at a point in time.
    class Listing {
    public:
        using const_iterator = std::vector<DescriptorPtr>::const_iterator;

        const_iterator begin() const { return table_->ordered.begin(); }
        const_iterator end() const { return table_->ordered.end(); }
        size_t size() const noexcept { return table_->ordered.size(); }
        bool empty() const noexcept { return table_->ordered.empty(); }
        const DescriptorPtr& operator[](size_t i) const { return table_->ordered[i]; }

    private:
        friend class CapabilityRegistry;
        explicit Listing(std::shared_ptr<const Table> table) : table_(std::move(table)) {}
        std::shared_ptr<const Table> table_;
    };

    struct TemplateMatch {
        DescriptorPtr descriptor;
        nlohmann::json variables;
    };

    explicit CapabilityRegistry(RegistrationPolicy policy = RegistrationPolicy::Strict);

    CapabilityRegistry(const CapabilityRegistry&) = delete;
    CapabilityRegistry& operator=(const CapabilityRegistry&) = delete;

    /// Throws DuplicateNameError (Strict policy) or std::invalid_argument
    /// for an empty name or missing handler.
    DescriptorPtr add(Category category, CapabilityDescriptor descriptor);

    /// Throws NotFoundError.
    [[nodiscard]] DescriptorPtr lookup(Category category, const std::string& name) const;

    /// nullptr when absent.
    [[nodiscard]] DescriptorPtr find(Category category, const std::string& name) const;

    /// First resource template (in registration order) matching `uri`.
    [[nodiscard]] std::optional<TemplateMatch> match_template(const std::string& uri) const;

    [[nodiscard]] Listing list(Category category) const;

    bool remove(Category category, const std::string& name);

    [[nodiscard]] size_t size(Category category) const;
    [[nodiscard]] bool empty(Category category) const { return size(category) == 0; }

    RegistrationPolicy policy() const noexcept { return policy_; }

private:
    std::shared_ptr<const Table> snapshot(Category category) const;
    static size_t slot(Category category) noexcept { return static_cast<size_t>(category); }

    RegistrationPolicy policy_;
    mutable std::shared_mutex mutex_;
    std::array<std::shared_ptr<const Table>, 3> tables_;
};

} // namespace toolhost
