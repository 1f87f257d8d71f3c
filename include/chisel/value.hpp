/*
 * chisel
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef CHISEL_VALUE_HPP
#define CHISEL_VALUE_HPP

#pragma once
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "config.hpp"
#include "number.hpp"

namespace chisel {

    enum class Type : std::uint8_t {
        Null,
        Bool,
        Number,
        String,
        Array,
        Object
    };

    [[nodiscard]] constexpr const char* type_name(const Type t) noexcept {
        switch (t) {
        case Type::Null:
            return "null";
        case Type::Bool:
            return "bool";
        case Type::Number:
            return "number";
        case Type::String:
            return "string";
        case Type::Array:
            return "array";
        case Type::Object:
            return "object";
        }
        return "unknown";
    }

    class Value;
    class Object;
    using Array = std::vector<Value>;

    // Owned JSON tree node. Containers are heap allocated and exclusively owned;
    // copy, comparison and destruction walk nested containers with explicit stacks.
    class Value {
    public:
        Value() noexcept = default;
        Value(std::nullptr_t) noexcept { } // NOLINT(google-explicit-constructor)
        Value(const bool b) noexcept: v_(b) { } // NOLINT(google-explicit-constructor)
        Value(const Number n) noexcept: v_(n) { } // NOLINT(google-explicit-constructor)
        Value(const int i) noexcept: v_(Number::from_i64(i)) { } // NOLINT(google-explicit-constructor)
        Value(const std::int64_t i) noexcept: v_(Number::from_i64(i)) { } // NOLINT(google-explicit-constructor)
        Value(const double d) noexcept: v_(Number::from_double(d)) { } // NOLINT(google-explicit-constructor)
        Value(std::string s) noexcept: v_(std::move(s)) { } // NOLINT(google-explicit-constructor)
        Value(const std::string_view s): v_(std::string(s)) { } // NOLINT(google-explicit-constructor)
        Value(const char* s): v_(std::string(s)) { } // NOLINT(google-explicit-constructor)
        Value(Array a); // NOLINT(google-explicit-constructor)
        Value(Object o); // NOLINT(google-explicit-constructor)

        Value(const Value& o);
        Value(Value&& o) noexcept;
        Value& operator=(const Value& o);
        Value& operator=(Value&& o) noexcept;
        ~Value();

        [[nodiscard]] static Value array();
        [[nodiscard]] static Value object();

        [[nodiscard]] CHISEL_FORCEINLINE Type type() const noexcept {
            return static_cast<Type>(v_.index());
        }

        [[nodiscard]] CHISEL_FORCEINLINE bool is_null() const noexcept {
            return type() == Type::Null;
        }
        [[nodiscard]] CHISEL_FORCEINLINE bool is_bool() const noexcept {
            return type() == Type::Bool;
        }
        [[nodiscard]] CHISEL_FORCEINLINE bool is_number() const noexcept {
            return type() == Type::Number;
        }
        [[nodiscard]] CHISEL_FORCEINLINE bool is_integer() const noexcept {
            return is_number() && std::get<Number>(v_).is_integer();
        }
        [[nodiscard]] CHISEL_FORCEINLINE bool is_float() const noexcept {
            return is_number() && std::get<Number>(v_).is_float();
        }
        [[nodiscard]] CHISEL_FORCEINLINE bool is_string() const noexcept {
            return type() == Type::String;
        }
        [[nodiscard]] CHISEL_FORCEINLINE bool is_array() const noexcept {
            return type() == Type::Array;
        }
        [[nodiscard]] CHISEL_FORCEINLINE bool is_object() const noexcept {
            return type() == Type::Object;
        }
        [[nodiscard]] CHISEL_FORCEINLINE bool is_container() const noexcept {
            return is_array() || is_object();
        }

        [[nodiscard]] std::optional<bool> try_bool() const noexcept {
            if (const auto* b = std::get_if<bool>(&v_))
                return *b;
            return std::nullopt;
        }
        [[nodiscard]] std::optional<Number> try_number() const noexcept {
            if (const auto* n = std::get_if<Number>(&v_))
                return *n;
            return std::nullopt;
        }
        [[nodiscard]] std::optional<std::int64_t> try_i64() const noexcept {
            if (const auto* n = std::get_if<Number>(&v_); n && n->is_integer())
                return n->i;
            return std::nullopt;
        }
        [[nodiscard]] std::optional<double> try_double() const noexcept {
            if (const auto* n = std::get_if<Number>(&v_))
                return n->as_double();
            return std::nullopt;
        }
        [[nodiscard]] std::optional<std::string_view> try_string() const noexcept {
            if (const auto* s = std::get_if<std::string>(&v_))
                return std::string_view {*s};
            return std::nullopt;
        }

        [[nodiscard]] CHISEL_FORCEINLINE bool as_bool(const bool def = false) const noexcept {
            return try_bool().value_or(def);
        }
        [[nodiscard]] CHISEL_FORCEINLINE std::int64_t as_i64(const std::int64_t def = 0) const noexcept {
            return try_i64().value_or(def);
        }
        [[nodiscard]] CHISEL_FORCEINLINE double as_double(const double def = 0.0) const noexcept {
            return try_double().value_or(def);
        }
        [[nodiscard]] CHISEL_FORCEINLINE std::string_view as_string(const std::string_view def = {}) const noexcept {
            return try_string().value_or(def);
        }
        [[nodiscard]] CHISEL_FORCEINLINE Number as_number() const noexcept {
            return try_number().value_or(Number {});
        }

        // nullptr when the value is not of the requested container type
        [[nodiscard]] Array* get_array() noexcept;
        [[nodiscard]] const Array* get_array() const noexcept;
        [[nodiscard]] Object* get_object() noexcept;
        [[nodiscard]] const Object* get_object() const noexcept;
        [[nodiscard]] std::string* get_string() noexcept {
            return std::get_if<std::string>(&v_);
        }

        // element count of a container, 0 otherwise
        [[nodiscard]] std::size_t size() const noexcept;

        // lookups return a shared null value when the path does not exist
        [[nodiscard]] const Value& at(std::size_t i) const noexcept;
        [[nodiscard]] const Value& get(std::string_view key) const noexcept;
        [[nodiscard]] const Value* find(std::string_view key) const noexcept;
        [[nodiscard]] Value* find(std::string_view key) noexcept;
        [[nodiscard]] bool contains(std::string_view key) const noexcept;

        [[nodiscard]] CHISEL_FORCEINLINE const Value& operator[](const std::size_t i) const noexcept {
            return at(i);
        }
        [[nodiscard]] CHISEL_FORCEINLINE const Value& operator[](const std::string_view key) const noexcept {
            return get(key);
        }

        friend bool operator==(const Value& a, const Value& b);

    private:
        using Storage = std::variant<std::monostate, bool, Number, std::string, std::unique_ptr<Array>, std::unique_ptr<Object>>;

        [[nodiscard]] static const Value& null_value() noexcept {
            static const Value v;
            return v;
        }

        // copies scalars, gives containers an empty shell of the same type
        [[nodiscard]] static Value shallow_copy(const Value& src);
        void deep_copy_from(const Value& src);
        [[nodiscard]] bool has_nested_container() const noexcept;
        void release_iterative() noexcept;
        static void drain_into(Value& v, std::vector<Value>& out);

        Storage v_ {};
    };

    struct Member {
        std::string key;
        Value value;
    };

    namespace detail {

        [[nodiscard]] CHISEL_FORCEINLINE std::uint32_t hash32(const void* data, std::size_t len) noexcept {
            constexpr auto seed = 0x9E3779B9u;

            const auto* p = static_cast<const std::uint8_t*>(data);
            std::uint32_t h = seed ^ static_cast<std::uint32_t>(len);

            while (len >= 4) {
                std::uint32_t v;
                std::memcpy(&v, p, 4);
                h ^= v;
                h *= 0x85EBCA6Bu;
                h ^= h >> 13;
                p += 4;
                len -= 4;
            }

            std::uint32_t tail = 0;
            for (std::size_t i = 0; i < len; ++i)
                tail |= static_cast<std::uint32_t>(p[i]) << (i * 8);

            h ^= tail;
            h *= 0xC2B2AE35u;
            h ^= h >> 16;

            return h ? h : 1u;
        }

        [[nodiscard]] CHISEL_FORCEINLINE std::uint32_t hash_key(const std::string_view k) noexcept {
            return hash32(k.data(), k.size());
        }

    } // namespace detail

    // Insertion-ordered member list with unique keys. Small objects are scanned
    // linearly; larger ones carry an open-addressing index over member positions.
    class Object {
    public:
        static constexpr std::size_t kIndexThreshold = 16;
        static constexpr std::size_t npos = static_cast<std::size_t>(-1);

        using iterator = std::vector<Member>::iterator;
        using const_iterator = std::vector<Member>::const_iterator;

        Object() = default;

        [[nodiscard]] CHISEL_FORCEINLINE std::size_t size() const noexcept {
            return members_.size();
        }
        [[nodiscard]] CHISEL_FORCEINLINE bool empty() const noexcept {
            return members_.empty();
        }

        [[nodiscard]] iterator begin() noexcept {
            return members_.begin();
        }
        [[nodiscard]] iterator end() noexcept {
            return members_.end();
        }
        [[nodiscard]] const_iterator begin() const noexcept {
            return members_.begin();
        }
        [[nodiscard]] const_iterator end() const noexcept {
            return members_.end();
        }

        [[nodiscard]] const Member& member(const std::size_t i) const noexcept {
            return members_[i];
        }

        void reserve(const std::size_t n) {
            members_.reserve(n);
        }

        void clear() noexcept {
            members_.clear();
            slots_.clear();
        }

        [[nodiscard]] std::size_t position(const std::string_view key) const noexcept {
            if (slots_.empty()) {
                for (std::size_t i = 0; i < members_.size(); ++i) {
                    if (members_[i].key == key)
                        return i;
                }
                return npos;
            }

            const auto h = detail::hash_key(key);
            const auto mask = static_cast<std::uint32_t>(slots_.size() - 1);
            for (auto pos = h & mask;; pos = (pos + 1) & mask) {
                const auto& s = slots_[pos];
                if (s.h == kEmpty)
                    return npos;
                if (s.h == h && members_[s.pos].key == key)
                    return s.pos;
            }
        }

        [[nodiscard]] Value* find(const std::string_view key) noexcept {
            const auto i = position(key);
            return i == npos ? nullptr : &members_[i].value;
        }

        [[nodiscard]] const Value* find(const std::string_view key) const noexcept {
            const auto i = position(key);
            return i == npos ? nullptr : &members_[i].value;
        }

        [[nodiscard]] bool contains(const std::string_view key) const noexcept {
            return position(key) != npos;
        }

        // Last write wins: a repeated key replaces the value in place and the member
        // keeps the position of its first insertion.
        Value& insert(std::string key, Value value) {
            if (const auto i = position(key); i != npos) {
                members_[i].value = std::move(value);
                return members_[i].value;
            }
            return append_unique(std::move(key), std::move(value));
        }

        // inserts null when the key is missing
        Value& operator[](const std::string_view key) {
            if (auto* v = find(key))
                return *v;
            return append_unique(std::string(key), Value {});
        }

        bool erase(const std::string_view key) {
            const auto i = position(key);
            if (i == npos)
                return false;
            erase_at(i);
            return true;
        }

        // caller guarantees the key is not present
        Value& append_unique(std::string key, Value value) {
            members_.push_back(Member {std::move(key), std::move(value)});
            const auto pos = members_.size() - 1;

            if (slots_.empty()) {
                if (members_.size() > kIndexThreshold)
                    rebuild_index();
            } else if (members_.size() * 2 > slots_.size()) {
                rebuild_index();
            } else {
                place(detail::hash_key(members_[pos].key), static_cast<std::uint32_t>(pos));
            }
            return members_[pos].value;
        }

    private:
        friend class Value;

        static constexpr auto kEmpty = 0u;

        struct Slot {
            std::uint32_t h;
            std::uint32_t pos;
        };

        void erase_at(const std::size_t i) {
            members_.erase(members_.begin() + static_cast<std::ptrdiff_t>(i));
            rebuild_index();
        }

        void place(const std::uint32_t h, const std::uint32_t pos) noexcept {
            const auto mask = static_cast<std::uint32_t>(slots_.size() - 1);
            auto at = h & mask;
            while (slots_[at].h != kEmpty)
                at = (at + 1) & mask;
            slots_[at] = Slot {h, pos};
        }

        void rebuild_index() {
            if (members_.size() <= kIndexThreshold) {
                slots_.clear();
                return;
            }

            std::size_t cap = 32;
            while (cap < members_.size() * 4)
                cap <<= 1;

            slots_.assign(cap, Slot {kEmpty, 0});
            for (std::size_t i = 0; i < members_.size(); ++i)
                place(detail::hash_key(members_[i].key), static_cast<std::uint32_t>(i));
        }

        std::vector<Member> members_ {};
        std::vector<Slot> slots_ {};
    };

    // out-of-line members that need Array and Object complete

    inline Value::Value(Array a): v_(std::make_unique<Array>(std::move(a))) { }

    inline Value::Value(Object o): v_(std::make_unique<Object>(std::move(o))) { }

    inline Value::Value(const Value& o) {
        deep_copy_from(o);
    }

    inline Value::Value(Value&& o) noexcept: v_(std::exchange(o.v_, std::monostate {})) { }

    inline Value& Value::operator=(const Value& o) {
        if (this != &o) {
            Value tmp(o);
            *this = std::move(tmp);
        }
        return *this;
    }

    inline Value& Value::operator=(Value&& o) noexcept {
        if (this != &o) {
            Value old(std::move(*this));
            v_ = std::exchange(o.v_, std::monostate {});
        }
        return *this;
    }

    inline Value::~Value() {
        if (has_nested_container())
            release_iterative();
    }

    inline Value Value::array() {
        return Value {Array {}};
    }

    inline Value Value::object() {
        return Value {Object {}};
    }

    inline Array* Value::get_array() noexcept {
        auto* p = std::get_if<std::unique_ptr<Array>>(&v_);
        return p ? p->get() : nullptr;
    }

    inline const Array* Value::get_array() const noexcept {
        const auto* p = std::get_if<std::unique_ptr<Array>>(&v_);
        return p ? p->get() : nullptr;
    }

    inline Object* Value::get_object() noexcept {
        auto* p = std::get_if<std::unique_ptr<Object>>(&v_);
        return p ? p->get() : nullptr;
    }

    inline const Object* Value::get_object() const noexcept {
        const auto* p = std::get_if<std::unique_ptr<Object>>(&v_);
        return p ? p->get() : nullptr;
    }

    inline std::size_t Value::size() const noexcept {
        if (const auto* a = get_array())
            return a->size();
        if (const auto* o = get_object())
            return o->size();
        return 0;
    }

    inline const Value& Value::at(const std::size_t i) const noexcept {
        if (const auto* a = get_array(); a && i < a->size())
            return (*a)[i];
        return null_value();
    }

    inline const Value* Value::find(const std::string_view key) const noexcept {
        const auto* o = get_object();
        return o ? o->find(key) : nullptr;
    }

    inline Value* Value::find(const std::string_view key) noexcept {
        auto* o = get_object();
        return o ? o->find(key) : nullptr;
    }

    inline const Value& Value::get(const std::string_view key) const noexcept {
        const auto* v = find(key);
        return v ? *v : null_value();
    }

    inline bool Value::contains(const std::string_view key) const noexcept {
        return find(key) != nullptr;
    }

    inline Value Value::shallow_copy(const Value& src) {
        switch (src.type()) {
        case Type::Array: {
            Array a;
            a.reserve(src.get_array()->size());
            return Value {std::move(a)};
        }
        case Type::Object: {
            Object o;
            o.reserve(src.get_object()->size());
            return Value {std::move(o)};
        }
        case Type::Null:
            return Value {};
        case Type::Bool:
            return Value {std::get<bool>(src.v_)};
        case Type::Number:
            return Value {std::get<Number>(src.v_)};
        case Type::String:
            return Value {std::get<std::string>(src.v_)};
        }
        return Value {};
    }

    inline void Value::deep_copy_from(const Value& src) {
        v_ = std::move(shallow_copy(src).v_);
        if (!src.is_container())
            return;

        struct Job {
            const Value* from;
            Value* to;
        };

        std::vector<Job> stack;
        stack.push_back(Job {&src, this});

        while (!stack.empty()) {
            const Job job = stack.back();
            stack.pop_back();

            if (const auto* from = job.from->get_array()) {
                auto& to = *job.to->get_array();
                for (const auto& child : *from)
                    to.push_back(shallow_copy(child));
                // children are queued after the pushes so no reallocation moves them
                for (std::size_t i = 0; i < from->size(); ++i) {
                    if ((*from)[i].is_container())
                        stack.push_back(Job {&(*from)[i], &to[i]});
                }
            } else if (const auto* from_obj = job.from->get_object()) {
                auto& to = *job.to->get_object();
                for (const auto& m : *from_obj)
                    to.append_unique(m.key, shallow_copy(m.value));
                for (std::size_t i = 0; i < from_obj->size(); ++i) {
                    if (from_obj->members_[i].value.is_container())
                        stack.push_back(Job {&from_obj->members_[i].value, &to.members_[i].value});
                }
            }
        }
    }

    inline bool Value::has_nested_container() const noexcept {
        if (const auto* a = get_array()) {
            for (const auto& v : *a) {
                if (v.is_container())
                    return true;
            }
        } else if (const auto* o = get_object()) {
            for (const auto& m : *o) {
                if (m.value.is_container())
                    return true;
            }
        }
        return false;
    }

    inline void Value::drain_into(Value& v, std::vector<Value>& out) {
        if (auto* a = v.get_array()) {
            for (auto& child : *a) {
                if (child.is_container())
                    out.push_back(std::move(child));
            }
            a->clear();
        } else if (auto* o = v.get_object()) {
            for (auto& m : *o) {
                if (m.value.is_container())
                    out.push_back(std::move(m.value));
            }
            o->clear();
        }
    }

    // Flattens the subtree so every node is destroyed with empty children.
    inline void Value::release_iterative() noexcept {
        std::vector<Value> pending;
        drain_into(*this, pending);
        while (!pending.empty()) {
            Value v = std::move(pending.back());
            pending.pop_back();
            drain_into(v, pending);
        }
    }

    // Structural equality. Numbers compare by kind and value, objects ignore member order.
    inline bool operator==(const Value& a, const Value& b) {
        std::vector<std::pair<const Value*, const Value*>> stack;
        stack.emplace_back(&a, &b);

        while (!stack.empty()) {
            const auto [x, y] = stack.back();
            stack.pop_back();

            if (x->type() != y->type())
                return false;

            switch (x->type()) {
            case Type::Null:
                break;
            case Type::Bool:
                if (std::get<bool>(x->v_) != std::get<bool>(y->v_))
                    return false;
                break;
            case Type::Number:
                if (!(std::get<Number>(x->v_) == std::get<Number>(y->v_)))
                    return false;
                break;
            case Type::String:
                if (std::get<std::string>(x->v_) != std::get<std::string>(y->v_))
                    return false;
                break;
            case Type::Array: {
                const auto& xa = *x->get_array();
                const auto& ya = *y->get_array();
                if (xa.size() != ya.size())
                    return false;
                for (std::size_t i = 0; i < xa.size(); ++i)
                    stack.emplace_back(&xa[i], &ya[i]);
                break;
            }
            case Type::Object: {
                const auto& xo = *x->get_object();
                const auto& yo = *y->get_object();
                if (xo.size() != yo.size())
                    return false;
                for (const auto& m : xo) {
                    const auto* other = yo.find(m.key);
                    if (!other)
                        return false;
                    stack.emplace_back(&m.value, other);
                }
                break;
            }
            }
        }
        return true;
    }

} // namespace chisel

#endif // CHISEL_VALUE_HPP
