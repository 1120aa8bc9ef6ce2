#pragma once

#ifdef __cplusplus

#include "record.hpp"
#include <cstddef>
#include <iterator>
#include <string>
#include <vector>

namespace accord {

// ============================================================================
// projection - lazy view of one field's values across a list of records.
// Iterating again starts over; nothing is copied.
// ============================================================================

class projection {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = accord::value_t;
        using difference_type = std::ptrdiff_t;
        using pointer = const accord::value_t*;
        using reference = const accord::value_t&;

        iterator() = default;
        iterator(std::vector<record>::const_iterator it, size_t index) : it_(it), index_(index) {}

        reference operator*() const { return it_->at(index_); }
        pointer operator->() const { return &it_->at(index_); }

        iterator& operator++() { ++it_; return *this; }
        iterator operator++(int) { iterator tmp = *this; ++it_; return tmp; }

        bool operator==(const iterator& other) const { return it_ == other.it_; }
        bool operator!=(const iterator& other) const { return it_ != other.it_; }

    private:
        std::vector<record>::const_iterator it_;
        size_t index_ = 0;
    };

    projection(const std::vector<record>& records, size_t index) : records_(&records), index_(index) {}

    iterator begin() const { return iterator(records_->begin(), index_); }
    iterator end() const { return iterator(records_->end(), index_); }

    size_t size() const { return records_->size(); }
    bool empty() const { return records_->empty(); }

private:
    const std::vector<record>* records_;
    size_t index_;
};

// ============================================================================
// record_list - ordered records sharing one schema
// ============================================================================

class record_list {
public:
    using iterator = std::vector<record>::iterator;
    using const_iterator = std::vector<record>::const_iterator;

    explicit record_list(record_schema_ptr schema);
    record_list(record_schema_ptr schema, std::vector<record> records);
    virtual ~record_list() = default;

    record_list(const record_list&) = default;
    record_list& operator=(const record_list&) = default;
    /// A moved-from list keeps its schema and is empty
    record_list(record_list&& other) noexcept;
    record_list& operator=(record_list&& other) noexcept;

    const record_schema& schema() const { return *schema_; }
    const record_schema_ptr& schema_ptr() const { return schema_; }

    /// The following throw schema_violation_error for records of another
    /// schema or a position outside the list
    void append(record r);
    void insert(size_t pos, record r);
    void set(size_t index, record r);

    /// Append a new record built from positional values
    record& emplace(std::vector<value_t> values);

    /// Throws schema_violation_error for a position outside the list
    void erase(size_t index);
    void clear() { records_.clear(); }

    /// Bounds-checked like std::vector::at (std::out_of_range)
    const record& at(size_t index) const { return records_.at(index); }
    record& at(size_t index) { return records_.at(index); }

    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    iterator begin() { return records_.begin(); }
    iterator end() { return records_.end(); }
    const_iterator begin() const { return records_.begin(); }
    const_iterator end() const { return records_.end(); }

    /// Lazy sequence of one field's values in list order.
    /// Throws schema_violation_error for unknown field names.
    projection project(const std::string& field_name) const;

    bool operator==(const record_list& other) const;
    bool operator!=(const record_list& other) const { return !(*this == other); }

    std::string to_string() const;

private:
    record_schema_ptr schema_;
    std::vector<record> records_;

    void check(const record& r) const;
    void check_index(size_t index, size_t limit, const char* operation) const;
};

} // namespace accord

#endif // __cplusplus
