#pragma once
// CategoryIndex: roaring posting bitmaps from category to entity slots
//
// Built once per snapshot. Answers category filters in O(1) per slot and
// per-category counts without scanning entities.

#include "types.hpp"
#include <roaring/roaring.h>
#include <map>
#include <string>
#include <vector>

namespace sutra {

class CategoryIndex {
public:
    CategoryIndex() = default;

    ~CategoryIndex() {
        for (auto& [_, bitmap] : postings_) {
            roaring_bitmap_free(bitmap);
        }
    }

    CategoryIndex(const CategoryIndex&) = delete;
    CategoryIndex& operator=(const CategoryIndex&) = delete;

    CategoryIndex(CategoryIndex&& other) noexcept : postings_(std::move(other.postings_)) {
        other.postings_.clear();
    }

    CategoryIndex& operator=(CategoryIndex&& other) noexcept {
        if (this != &other) {
            for (auto& [_, bitmap] : postings_) roaring_bitmap_free(bitmap);
            postings_ = std::move(other.postings_);
            other.postings_.clear();
        }
        return *this;
    }

    void add(const std::string& category, Slot slot) {
        auto it = postings_.find(category);
        if (it == postings_.end()) {
            it = postings_.emplace(category, roaring_bitmap_create()).first;
        }
        roaring_bitmap_add(it->second, slot);
    }

    bool contains(const std::string& category, Slot slot) const {
        auto it = postings_.find(category);
        if (it == postings_.end()) return false;
        return roaring_bitmap_contains(it->second, slot);
    }

    bool has_category(const std::string& category) const {
        return postings_.count(category) > 0;
    }

    uint64_t count(const std::string& category) const {
        auto it = postings_.find(category);
        if (it == postings_.end()) return 0;
        return roaring_bitmap_get_cardinality(it->second);
    }

    // Slots in ascending order (= ascending id order)
    std::vector<Slot> slots(const std::string& category) const {
        auto it = postings_.find(category);
        if (it == postings_.end()) return {};
        return bitmap_to_vector(it->second);
    }

    std::vector<std::string> categories() const {
        std::vector<std::string> result;
        result.reserve(postings_.size());
        for (const auto& [category, _] : postings_) {
            result.push_back(category);
        }
        return result;
    }

    std::map<std::string, uint64_t> counts() const {
        std::map<std::string, uint64_t> result;
        for (const auto& [category, bitmap] : postings_) {
            result[category] = roaring_bitmap_get_cardinality(bitmap);
        }
        return result;
    }

private:
    static std::vector<Slot> bitmap_to_vector(const roaring_bitmap_t* bitmap) {
        uint64_t card = roaring_bitmap_get_cardinality(bitmap);
        std::vector<uint32_t> result(card);
        if (card > 0) {
            roaring_bitmap_to_uint32_array(bitmap, result.data());
        }
        return result;
    }

    std::map<std::string, roaring_bitmap_t*> postings_;
};

} // namespace sutra
