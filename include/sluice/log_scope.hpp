/**
 * @file log_scope.hpp
 * @brief Thread-local stack of ambient properties merged into every entry
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Each thread keeps a chain of scope nodes. begin_scope() pushes a node and
 * returns a handle; destroying the handle restores the node's parent as the
 * current tip. Entries logged while a scope is active carry the merged
 * properties of the whole chain, inner scopes winning on name collisions.
 *
 * @code
 * auto outer = sluice::begin_scope({{"RequestId", 42}});
 * {
 *     auto inner = sluice::begin_scope({{"User", "alice"}});
 *     logger.info("Loaded profile"); // RequestId=42, User=alice
 * }
 * logger.info("Done");               // RequestId=42
 * @endcode
 *
 * @note Handles must be destroyed on the thread that created them, in LIFO
 *       order. Destroying a handle that is not the tip restores that
 *       handle's parent, discarding any scopes opened after it.
 */
#pragma once

#include <concepts>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "log_types.hpp"
#include "log_value.hpp"
#include "log_template.hpp"

namespace sluice
{

/**
 * @brief A name/value pair accepted wherever properties are built inline
 */
struct log_property
{
    std::string name;
    log_value value;

    template <typename T>
    log_property(std::string_view n, T &&v) : name(n), value(to_log_value(std::forward<T>(v)))
    {
    }
};

/**
 * @brief Types that can describe themselves as scope state
 *
 * Implement `log_properties to_log_properties() const` on a type to allow
 * passing it directly to begin_scope().
 */
template <typename T>
concept ScopeState = requires(const T &state) {
    { state.to_log_properties() } -> std::convertible_to<log_properties>;
};

namespace detail
{

struct scope_node
{
    log_properties properties;
    std::shared_ptr<const scope_node> parent;
};

inline std::shared_ptr<const scope_node> &scope_tip()
{
    thread_local std::shared_ptr<const scope_node> tip_;
    return tip_;
}

} // namespace detail

/**
 * @brief RAII handle for an active scope
 */
class scope_handle
{
  public:
    scope_handle() = default;

    explicit scope_handle(log_properties props)
    {
        auto &tip = detail::scope_tip();
        parent_   = tip;
        node_     = std::make_shared<const detail::scope_node>(detail::scope_node{std::move(props), tip});
        tip       = node_;
    }

    scope_handle(const scope_handle &)            = delete;
    scope_handle &operator=(const scope_handle &) = delete;

    scope_handle(scope_handle &&other) noexcept
        : node_(std::move(other.node_)), parent_(std::move(other.parent_))
    {
    }

    scope_handle &operator=(scope_handle &&other) noexcept
    {
        if (this != &other)
        {
            end();
            node_   = std::move(other.node_);
            parent_ = std::move(other.parent_);
        }
        return *this;
    }

    ~scope_handle() { end(); }

    /// Close the scope early. Idempotent.
    void end() noexcept
    {
        if (!node_) return;
        detail::scope_tip() = std::move(parent_);
        node_.reset();
        parent_.reset();
    }

    bool active() const { return node_ != nullptr; }

    const log_properties &properties() const
    {
        static const log_properties empty_;
        return node_ ? node_->properties : empty_;
    }

  private:
    std::shared_ptr<const detail::scope_node> node_;
    std::shared_ptr<const detail::scope_node> parent_;
};

/**
 * @brief Merge the current thread's scope chain
 * @return Properties of every active scope, inner names taking precedence
 */
inline log_properties current_scope_properties()
{
    log_properties merged;
    for (auto node = detail::scope_tip().get(); node != nullptr; node = node->parent.get())
    {
        for (const auto &[name, value] : node->properties) { add_property(merged, name, value); }
    }
    return merged;
}

inline scope_handle begin_scope(log_properties props) { return scope_handle(std::move(props)); }

/// Later duplicates of a name replace earlier ones within one scope
inline scope_handle begin_scope(std::initializer_list<log_property> props)
{
    log_properties map;
    for (const auto &p : props) { map.insert_or_assign(p.name, p.value); }
    return scope_handle(std::move(map));
}

inline scope_handle begin_scope(log_property prop)
{
    log_properties map;
    map.emplace(std::move(prop.name), std::move(prop.value));
    return scope_handle(std::move(map));
}

/// A plain string is stored under the "Scope" property
inline scope_handle begin_scope(std::string_view text)
{
    log_properties map;
    map.emplace("Scope", std::string(text));
    return scope_handle(std::move(map));
}

template <ScopeState T>
scope_handle begin_scope(const T &state)
{
    return scope_handle(state.to_log_properties());
}

/**
 * @brief Begin a scope whose properties are parsed from a message template
 *
 * `begin_scope("Order {OrderId} for {Customer}", 7, "acme")` yields
 * OrderId=7, Customer="acme".
 */
template <typename Arg, typename... Args>
scope_handle begin_scope(std::string_view tmpl, Arg &&arg, Args &&...args)
{
    const log_value values[] = {to_log_value(std::forward<Arg>(arg)), to_log_value(std::forward<Args>(args))...};
    return scope_handle(parse_template(tmpl, values).properties);
}

} // namespace sluice
