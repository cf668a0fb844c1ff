/**
 * @file ObservableCollections.hpp
 * @brief Ordered lists that notify observers about content changes
 *
 * This file defines the two list kinds used in data-binding scenarios:
 * - ObservableList<T>: raises CollectionChange events (Add, Remove, Replace, Reset)
 * - BindingList<T>: raises ListChange events (ItemAdded, ItemDeleted, ItemChanged, Reset)
 *
 * Observers bind to a list instance. The collection-aware copier merges
 * into an existing instance (clear, then append) so those bindings survive.
 *
 * Usage:
 * @code
 * auto tags = std::make_shared<ObservableList<std::string>>();
 * auto id = tags->subscribe([](const CollectionChange& change) {
 *     if (change.action == CollectionAction::Reset) refresh_view();
 * });
 * tags->add("red");
 * tags->unsubscribe(id);
 * @endcode
 */

#ifndef PROPSYNC_OBSERVABLE_COLLECTIONS_HPP
#define PROPSYNC_OBSERVABLE_COLLECTIONS_HPP

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

namespace propsync {

namespace detail {

/**
 * @brief Handler bookkeeping shared by both list kinds
 *
 * Subscribers belong to one list instance and are never copied with it.
 */
template<typename Event>
class SubscriberSet {
public:
    using Handler = std::function<void(const Event&)>;
    using Token = std::size_t;

    SubscriberSet() = default;
    SubscriberSet(const SubscriberSet&) {}
    SubscriberSet& operator=(const SubscriberSet&) { return *this; }

    Token add(Handler handler) {
        const Token token = ++last_token_;
        handlers_.emplace_back(token, std::move(handler));
        return token;
    }

    bool remove(Token token) {
        for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
            if (it->first == token) {
                handlers_.erase(it);
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return handlers_.size();
    }

    // Handlers may unsubscribe while being notified.
    void notify(const Event& event) const {
        if (handlers_.empty()) {
            return;
        }
        const auto snapshot = handlers_;
        for (const auto& [token, handler] : snapshot) {
            if (handler) {
                handler(event);
            }
        }
    }

private:
    std::vector<std::pair<Token, Handler>> handlers_;
    Token last_token_ = 0;
};

} // namespace detail

enum class CollectionAction {
    Add,
    Remove,
    Replace,
    Reset
};

inline std::string_view to_string(CollectionAction action) noexcept {
    switch (action) {
        case CollectionAction::Add:     return "Add";
        case CollectionAction::Remove:  return "Remove";
        case CollectionAction::Replace: return "Replace";
        case CollectionAction::Reset:   return "Reset";
    }
    return "Unknown";
}

/**
 * @brief Change notification raised by ObservableList
 *
 * index is the position of the first affected element, or npos for Reset.
 */
struct CollectionChange {
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    CollectionAction action = CollectionAction::Reset;
    std::size_t index = npos;
    std::size_t count = 0;
};

/**
 * @brief Ordered list with collection-changed notifications
 *
 * Elements are only reachable through const iterators so every mutation
 * goes through a notifying member function.
 *
 * @tparam T Element type
 */
template<typename T>
class ObservableList {
public:
    using value_type = T;
    using storage_type = std::vector<T>;
    using size_type = typename storage_type::size_type;
    using iterator = typename storage_type::const_iterator;
    using const_iterator = typename storage_type::const_iterator;
    using Handler = typename detail::SubscriberSet<CollectionChange>::Handler;
    using Subscription = typename detail::SubscriberSet<CollectionChange>::Token;

    ObservableList() = default;

    ObservableList(std::initializer_list<T> items)
        : items_(items) {}

    template<std::input_iterator InputIt>
    ObservableList(InputIt first, InputIt last)
        : items_(first, last) {}

    ObservableList(const ObservableList& other)
        : items_(other.items_) {}

    ObservableList(ObservableList&& other) noexcept
        : items_(std::move(other.items_)) {}

    /**
     * @brief Replace the contents, keeping this list's subscribers
     */
    ObservableList& operator=(const ObservableList& other) {
        if (this != &other) {
            items_ = other.items_;
            raise(CollectionAction::Reset, CollectionChange::npos, 0);
        }
        return *this;
    }

    ObservableList& operator=(ObservableList&& other) {
        if (this != &other) {
            items_ = std::move(other.items_);
            raise(CollectionAction::Reset, CollectionChange::npos, 0);
        }
        return *this;
    }

    // ==================== Size and Access ====================

    [[nodiscard]] size_type size() const noexcept { return items_.size(); }
    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }

    [[nodiscard]] const T& operator[](size_type index) const { return items_[index]; }

    [[nodiscard]] const T& at(size_type index) const { return items_.at(index); }

    iterator begin() const noexcept { return items_.cbegin(); }
    iterator end() const noexcept { return items_.cend(); }

    [[nodiscard]] const storage_type& items() const noexcept { return items_; }

    // ==================== Modification ====================

    void add(const T& value) {
        items_.push_back(value);
        raise(CollectionAction::Add, items_.size() - 1, 1);
    }

    void add(T&& value) {
        items_.push_back(std::move(value));
        raise(CollectionAction::Add, items_.size() - 1, 1);
    }

    void push_back(const T& value) { add(value); }
    void push_back(T&& value) { add(std::move(value)); }

    void insert(size_type index, T value) {
        if (index > items_.size()) {
            throw std::out_of_range("ObservableList::insert index out of range");
        }
        items_.insert(items_.begin() + static_cast<std::ptrdiff_t>(index), std::move(value));
        raise(CollectionAction::Add, index, 1);
    }

    void set(size_type index, T value) {
        items_.at(index) = std::move(value);
        raise(CollectionAction::Replace, index, 1);
    }

    void remove_at(size_type index) {
        if (index >= items_.size()) {
            throw std::out_of_range("ObservableList::remove_at index out of range");
        }
        items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(index));
        raise(CollectionAction::Remove, index, 1);
    }

    /**
     * @brief Remove every element; raises a single Reset
     */
    void clear() {
        items_.clear();
        raise(CollectionAction::Reset, CollectionChange::npos, 0);
    }

    // ==================== Notification ====================

    Subscription subscribe(Handler handler) {
        return subscribers_.add(std::move(handler));
    }

    bool unsubscribe(Subscription subscription) {
        return subscribers_.remove(subscription);
    }

    [[nodiscard]] std::size_t subscriber_count() const noexcept {
        return subscribers_.size();
    }

    friend bool operator==(const ObservableList& lhs, const ObservableList& rhs) {
        return lhs.items_ == rhs.items_;
    }

private:
    void raise(CollectionAction action, std::size_t index, std::size_t count) const {
        subscribers_.notify(CollectionChange{action, index, count});
    }

    storage_type items_;
    detail::SubscriberSet<CollectionChange> subscribers_;
};

enum class ListChangeType {
    ItemAdded,
    ItemDeleted,
    ItemChanged,
    Reset
};

/**
 * @brief Change notification raised by BindingList
 *
 * index is the affected position, or npos for Reset.
 */
struct ListChange {
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    ListChangeType type = ListChangeType::Reset;
    std::size_t index = npos;
};

/**
 * @brief Ordered list with list-changed notifications
 *
 * Notifications can be suspended with raise_list_changed_events(false)
 * and replayed as a single Reset through reset_bindings().
 *
 * @tparam T Element type
 */
template<typename T>
class BindingList {
public:
    using value_type = T;
    using storage_type = std::vector<T>;
    using size_type = typename storage_type::size_type;
    using iterator = typename storage_type::const_iterator;
    using const_iterator = typename storage_type::const_iterator;
    using Handler = typename detail::SubscriberSet<ListChange>::Handler;
    using Subscription = typename detail::SubscriberSet<ListChange>::Token;

    BindingList() = default;

    BindingList(std::initializer_list<T> items)
        : items_(items) {}

    template<std::input_iterator InputIt>
    BindingList(InputIt first, InputIt last)
        : items_(first, last) {}

    BindingList(const BindingList& other)
        : items_(other.items_) {}

    BindingList(BindingList&& other) noexcept
        : items_(std::move(other.items_)) {}

    BindingList& operator=(const BindingList& other) {
        if (this != &other) {
            items_ = other.items_;
            raise(ListChangeType::Reset, ListChange::npos);
        }
        return *this;
    }

    BindingList& operator=(BindingList&& other) {
        if (this != &other) {
            items_ = std::move(other.items_);
            raise(ListChangeType::Reset, ListChange::npos);
        }
        return *this;
    }

    [[nodiscard]] size_type size() const noexcept { return items_.size(); }
    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }

    [[nodiscard]] const T& operator[](size_type index) const { return items_[index]; }
    [[nodiscard]] const T& at(size_type index) const { return items_.at(index); }

    iterator begin() const noexcept { return items_.cbegin(); }
    iterator end() const noexcept { return items_.cend(); }

    [[nodiscard]] const storage_type& items() const noexcept { return items_; }

    void add(const T& value) {
        items_.push_back(value);
        raise(ListChangeType::ItemAdded, items_.size() - 1);
    }

    void add(T&& value) {
        items_.push_back(std::move(value));
        raise(ListChangeType::ItemAdded, items_.size() - 1);
    }

    void push_back(const T& value) { add(value); }
    void push_back(T&& value) { add(std::move(value)); }

    void insert(size_type index, T value) {
        if (index > items_.size()) {
            throw std::out_of_range("BindingList::insert index out of range");
        }
        items_.insert(items_.begin() + static_cast<std::ptrdiff_t>(index), std::move(value));
        raise(ListChangeType::ItemAdded, index);
    }

    void set(size_type index, T value) {
        items_.at(index) = std::move(value);
        raise(ListChangeType::ItemChanged, index);
    }

    void remove_at(size_type index) {
        if (index >= items_.size()) {
            throw std::out_of_range("BindingList::remove_at index out of range");
        }
        items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(index));
        raise(ListChangeType::ItemDeleted, index);
    }

    void clear() {
        items_.clear();
        raise(ListChangeType::Reset, ListChange::npos);
    }

    [[nodiscard]] bool raise_list_changed_events() const noexcept {
        return raise_events_;
    }

    void raise_list_changed_events(bool enabled) noexcept {
        raise_events_ = enabled;
    }

    void reset_bindings() {
        raise(ListChangeType::Reset, ListChange::npos);
    }

    Subscription subscribe(Handler handler) {
        return subscribers_.add(std::move(handler));
    }

    bool unsubscribe(Subscription subscription) {
        return subscribers_.remove(subscription);
    }

    [[nodiscard]] std::size_t subscriber_count() const noexcept {
        return subscribers_.size();
    }

    friend bool operator==(const BindingList& lhs, const BindingList& rhs) {
        return lhs.items_ == rhs.items_;
    }

private:
    void raise(ListChangeType type, std::size_t index) const {
        if (raise_events_) {
            subscribers_.notify(ListChange{type, index});
        }
    }

    storage_type items_;
    detail::SubscriberSet<ListChange> subscribers_;
    bool raise_events_ = true;
};

} // namespace propsync

#endif // PROPSYNC_OBSERVABLE_COLLECTIONS_HPP
