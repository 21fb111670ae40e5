#include <gtest/gtest.h>
#include "toolhost/registry.hpp"
#include "toolhost/error.hpp"
#include <atomic>
#include <thread>

using namespace toolhost;

namespace {

CapabilityDescriptor make(const std::string& name, const std::string& description = "") {
    CapabilityDescriptor d;
    d.name = name;
    d.description = description;
    d.handler = [](RequestContext&, const nlohmann::json&) -> InvocationResult {
        return SuccessContent{CallToolResult{}};
    };
    return d;
}

std::vector<std::string> names(const CapabilityRegistry::Listing& listing) {
    std::vector<std::string> out;
    for (const auto& d : listing) out.push_back(d->name);
    return out;
}

} // namespace

TEST(Registry, AddAndLookup) {
    CapabilityRegistry reg;
    reg.add(Category::Tool, make("echo", "Echo input"));
    auto d = reg.lookup(Category::Tool, "echo");
    ASSERT_NE(d, nullptr);
    EXPECT_EQ(d->description, "Echo input");
    EXPECT_EQ(reg.size(Category::Tool), 1u);
}

TEST(Registry, CategoriesAreIndependent) {
    CapabilityRegistry reg;
    reg.add(Category::Tool, make("same"));
    reg.add(Category::Prompt, make("same"));
    EXPECT_NE(reg.find(Category::Tool, "same"), nullptr);
    EXPECT_NE(reg.find(Category::Prompt, "same"), nullptr);
    EXPECT_EQ(reg.find(Category::Resource, "same"), nullptr);
    EXPECT_THROW(reg.lookup(Category::Resource, "same"), NotFoundError);
}

TEST(Registry, ListingKeepsRegistrationOrder) {
    CapabilityRegistry reg;
    for (const char* n : {"zeta", "alpha", "mid"}) reg.add(Category::Tool, make(n));
    EXPECT_EQ(names(reg.list(Category::Tool)), (std::vector<std::string>{"zeta", "alpha", "mid"}));
}

TEST(Registry, StrictRejectsDuplicate) {
    CapabilityRegistry reg(RegistrationPolicy::Strict);
    reg.add(Category::Tool, make("echo", "first"));
    EXPECT_THROW(reg.add(Category::Tool, make("echo", "second")), DuplicateNameError);
    EXPECT_EQ(reg.lookup(Category::Tool, "echo")->description, "first");
}

TEST(Registry, ReplaceMovesEntryToEnd) {
    CapabilityRegistry reg(RegistrationPolicy::Replace);
    reg.add(Category::Tool, make("a", "old"));
    reg.add(Category::Tool, make("b"));
    reg.add(Category::Tool, make("a", "new"));
    EXPECT_EQ(reg.lookup(Category::Tool, "a")->description, "new");
    EXPECT_EQ(names(reg.list(Category::Tool)), (std::vector<std::string>{"b", "a"}));
}

TEST(Registry, RejectsEmptyNameOrHandler) {
    CapabilityRegistry reg;
    EXPECT_THROW(reg.add(Category::Tool, make("")), std::invalid_argument);
    CapabilityDescriptor d;
    d.name = "nohandler";
    EXPECT_THROW(reg.add(Category::Tool, d), std::invalid_argument);
}

TEST(Registry, Remove) {
    CapabilityRegistry reg;
    reg.add(Category::Tool, make("a"));
    reg.add(Category::Tool, make("b"));
    EXPECT_TRUE(reg.remove(Category::Tool, "a"));
    EXPECT_FALSE(reg.remove(Category::Tool, "a"));
    EXPECT_EQ(names(reg.list(Category::Tool)), (std::vector<std::string>{"b"}));
    EXPECT_NE(reg.find(Category::Tool, "b"), nullptr);
}

TEST(Registry, ListingIsASnapshot) {
    CapabilityRegistry reg;
    reg.add(Category::Tool, make("a"));
    auto listing = reg.list(Category::Tool);
    reg.add(Category::Tool, make("b"));
    reg.remove(Category::Tool, "a");
    EXPECT_EQ(names(listing), (std::vector<std::string>{"a"}));
    EXPECT_EQ(names(reg.list(Category::Tool)), (std::vector<std::string>{"b"}));
}

TEST(Registry, ConcurrentReadersDuringWrites) {
    CapabilityRegistry reg(RegistrationPolicy::Replace);
    reg.add(Category::Tool, make("stable"));
    std::atomic<bool> stop{false};
    std::atomic<int> misses{0};

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!stop) {
                if (!reg.find(Category::Tool, "stable")) ++misses;
                for (const auto& d : reg.list(Category::Tool)) (void)d->name.size();
            }
        });
    }
    for (int i = 0; i < 200; ++i) {
        reg.add(Category::Tool, make("t" + std::to_string(i % 20)));
        reg.remove(Category::Tool, "t" + std::to_string((i + 10) % 20));
    }
    stop = true;
    for (auto& t : readers) t.join();
    EXPECT_EQ(misses.load(), 0);
}

// ---- URI templates ----

TEST(UriTemplate, Variables) {
    EXPECT_EQ(uri_template_variables("db://{schema}/{table}"),
              (std::vector<std::string>{"schema", "table"}));
    EXPECT_TRUE(uri_template_variables("config://app").empty());
}

TEST(UriTemplate, Match) {
    auto vars = match_uri_template("db://{schema}/{table}", "db://public/users");
    ASSERT_TRUE(vars.has_value());
    EXPECT_EQ((*vars)["schema"], "public");
    EXPECT_EQ((*vars)["table"], "users");

    auto tail = match_uri_template("file:///{path}", "file:///a/b/c.txt");
    ASSERT_TRUE(tail.has_value());
    EXPECT_EQ((*tail)["path"], "a/b/c.txt");
}

TEST(UriTemplate, NoMatch) {
    EXPECT_FALSE(match_uri_template("db://{schema}/{table}", "db://public").has_value());
    EXPECT_FALSE(match_uri_template("db://{schema}/{table}", "file://public/users").has_value());
    EXPECT_FALSE(match_uri_template("file:///{path}", "file:///").has_value());
}

TEST(Registry, MatchTemplateFirstRegisteredWins) {
    CapabilityRegistry reg;
    reg.add(Category::Resource, make("config://app"));
    reg.add(Category::Resource, make("users://{id}/profile"));
    reg.add(Category::Resource, make("users://{rest}"));

    auto m = reg.match_template("users://42/profile");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->descriptor->name, "users://{id}/profile");
    EXPECT_EQ(m->variables["id"], "42");

    auto other = reg.match_template("users://42");
    ASSERT_TRUE(other.has_value());
    EXPECT_EQ(other->descriptor->name, "users://{rest}");

    EXPECT_FALSE(reg.match_template("config://app").has_value());
    EXPECT_FALSE(reg.lookup(Category::Resource, "config://app")->is_template());
}
