#pragma once

#include <rowtree/core/error.hpp>

#include <algorithm>
#include <compare>
#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <utility>

namespace rowtree {

/// Comparator whose answer may be an error instead of an ordering.
template <typename C, typename K>
concept FallibleCompare = requires(const C& cmp, const K& a, const K& b) {
    { cmp(a, b) } -> std::same_as<Result<std::strong_ordering>>;
};

/// Balanced (AVL) ordered map with a fallible comparator.
///
/// Every comparison made while descending happens before the tree is
/// touched, so a failed comparison leaves the tree exactly as it was.
/// Rebalancing only runs on the way back up from a successful link or
/// unlink.
///
/// The tree must not be modified from inside ascend(); collect keys first
/// and erase afterwards.
template <typename K, typename V, FallibleCompare<K> Compare>
class OrderedTree {
   public:
    using key_type = K;
    using mapped_type = V;
    using size_type = std::size_t;

    OrderedTree() = default;
    explicit OrderedTree(Compare compare) : compare_(std::move(compare)) {}

    OrderedTree(const OrderedTree&) = delete;
    auto operator=(const OrderedTree&) -> OrderedTree& = delete;
    OrderedTree(OrderedTree&& other) noexcept
        : root_(std::move(other.root_)),
          size_(std::exchange(other.size_, 0)),
          compare_(std::move(other.compare_)) {}
    auto operator=(OrderedTree&& other) noexcept -> OrderedTree& {
        root_ = std::move(other.root_);
        size_ = std::exchange(other.size_, 0);
        compare_ = std::move(other.compare_);
        return *this;
    }
    ~OrderedTree() = default;

    [[nodiscard]] auto size() const noexcept -> size_type { return size_; }
    [[nodiscard]] auto empty() const noexcept -> bool { return size_ == 0; }

    /// Height of the tree; 0 when empty.
    [[nodiscard]] auto height() const noexcept -> int { return height_of(root_); }

    void clear() noexcept {
        root_.reset();
        size_ = 0;
    }

    /// Insert, or replace the entry with an equal key. Returns the replaced
    /// value, if any.
    auto insert_or_assign(K key, V value) -> Result<std::optional<V>> {
        std::optional<V> previous;
        auto status = insert_at(root_, key, value, previous);
        if (!status) {
            return std::unexpected(std::move(status.error()));
        }
        return previous;
    }

    /// Pointer to the value stored under `key`, or nullptr.
    [[nodiscard]] auto find(const K& key) const -> Result<const V*> {
        const Node* node = root_.get();
        while (node != nullptr) {
            auto order = compare_(key, node->key);
            if (!order) {
                return std::unexpected(std::move(order.error()));
            }
            if (*order == std::strong_ordering::equal) {
                return &node->value;
            }
            node = *order < 0 ? node->left.get() : node->right.get();
        }
        return static_cast<const V*>(nullptr);
    }

    [[nodiscard]] auto find(const K& key) -> Result<V*> {
        auto found = std::as_const(*this).find(key);
        if (!found) {
            return std::unexpected(std::move(found.error()));
        }
        return const_cast<V*>(*found);
    }

    /// Remove the entry under `key`. Returns the removed value, if any.
    auto erase(const K& key) -> Result<std::optional<V>> {
        std::optional<V> removed;
        auto status = erase_at(root_, key, removed);
        if (!status) {
            return std::unexpected(std::move(status.error()));
        }
        return removed;
    }

    /// In-order traversal of keys in [lower, upper). A null bound is
    /// unbounded on that side. `visit(key, value)` returns true to continue,
    /// false to stop, or an error which aborts the traversal.
    template <typename Visitor>
    auto ascend(const K* lower, const K* upper, Visitor&& visit) const -> Result<void> {
        bool stopped = false;
        return ascend_at(root_.get(), lower, upper, visit, stopped);
    }

   private:
    struct Node {
        Node(K k, V v) : key(std::move(k)), value(std::move(v)) {}

        K key;
        V value;
        std::unique_ptr<Node> left;
        std::unique_ptr<Node> right;
        int height = 1;
    };
    using NodePtr = std::unique_ptr<Node>;

    static auto height_of(const NodePtr& node) noexcept -> int {
        return node ? node->height : 0;
    }

    static void update_height(Node& node) noexcept {
        node.height = 1 + std::max(height_of(node.left), height_of(node.right));
    }

    static void rotate_left(NodePtr& node) noexcept {
        NodePtr pivot = std::move(node->right);
        node->right = std::move(pivot->left);
        update_height(*node);
        pivot->left = std::move(node);
        update_height(*pivot);
        node = std::move(pivot);
    }

    static void rotate_right(NodePtr& node) noexcept {
        NodePtr pivot = std::move(node->left);
        node->left = std::move(pivot->right);
        update_height(*node);
        pivot->right = std::move(node);
        update_height(*pivot);
        node = std::move(pivot);
    }

    static void rebalance(NodePtr& node) noexcept {
        update_height(*node);
        const int balance = height_of(node->left) - height_of(node->right);
        if (balance > 1) {
            if (height_of(node->left->left) < height_of(node->left->right)) {
                rotate_left(node->left);
            }
            rotate_right(node);
        } else if (balance < -1) {
            if (height_of(node->right->right) < height_of(node->right->left)) {
                rotate_right(node->right);
            }
            rotate_left(node);
        }
    }

    auto insert_at(NodePtr& node, K& key, V& value, std::optional<V>& previous) -> Result<void> {
        if (!node) {
            node = std::make_unique<Node>(std::move(key), std::move(value));
            ++size_;
            return {};
        }
        auto order = compare_(key, node->key);
        if (!order) {
            return std::unexpected(std::move(order.error()));
        }
        if (*order == std::strong_ordering::equal) {
            previous = std::exchange(node->value, std::move(value));
            node->key = std::move(key);
            return {};
        }
        auto status = insert_at(*order < 0 ? node->left : node->right, key, value, previous);
        if (!status) {
            return status;
        }
        rebalance(node);
        return {};
    }

    // Unlinks the leftmost node of the subtree and returns it.
    static auto detach_min(NodePtr& node) noexcept -> NodePtr {
        if (!node->left) {
            NodePtr min = std::move(node);
            node = std::move(min->right);
            return min;
        }
        NodePtr min = detach_min(node->left);
        rebalance(node);
        return min;
    }

    auto erase_at(NodePtr& node, const K& key, std::optional<V>& removed) -> Result<void> {
        if (!node) {
            return {};
        }
        auto order = compare_(key, node->key);
        if (!order) {
            return std::unexpected(std::move(order.error()));
        }
        if (*order != std::strong_ordering::equal) {
            auto status = erase_at(*order < 0 ? node->left : node->right, key, removed);
            if (!status) {
                return status;
            }
        } else {
            removed = std::move(node->value);
            --size_;
            if (!node->left) {
                node = std::move(node->right);
            } else if (!node->right) {
                node = std::move(node->left);
            } else {
                NodePtr successor = detach_min(node->right);
                successor->left = std::move(node->left);
                successor->right = std::move(node->right);
                node = std::move(successor);
            }
        }
        if (node) {
            rebalance(node);
        }
        return {};
    }

    template <typename Visitor>
    auto ascend_at(const Node* node, const K* lower, const K* upper, Visitor& visit,
                   bool& stopped) const -> Result<void> {
        if (node == nullptr || stopped) {
            return {};
        }
        bool above_lower = true;
        if (lower != nullptr) {
            auto order = compare_(node->key, *lower);
            if (!order) {
                return std::unexpected(std::move(order.error()));
            }
            above_lower = *order >= 0;
        }
        bool below_upper = true;
        if (upper != nullptr) {
            auto order = compare_(node->key, *upper);
            if (!order) {
                return std::unexpected(std::move(order.error()));
            }
            below_upper = *order < 0;
        }

        if (above_lower) {
            auto status = ascend_at(node->left.get(), lower, upper, visit, stopped);
            if (!status || stopped) {
                return status;
            }
            if (below_upper) {
                Result<bool> keep_going = visit(node->key, node->value);
                if (!keep_going) {
                    return std::unexpected(std::move(keep_going.error()));
                }
                if (!*keep_going) {
                    stopped = true;
                    return {};
                }
            }
        }
        if (below_upper) {
            return ascend_at(node->right.get(), lower, upper, visit, stopped);
        }
        return {};
    }

    NodePtr root_;
    size_type size_ = 0;
    [[no_unique_address]] Compare compare_{};
};

}  // namespace rowtree
