#pragma once
#include <optional>
#include <string>
#include <vector>

// Immutable, deduplicated, paginated view over one market type's instruments.
//
// The effective page size is always kept below the instrument count so that
// a full listing spans at least two pages; it never drops below 1.
class CurrencyRepo {
public:
    static constexpr int kDefaultPageSize = 10;

    // Duplicates are dropped, first occurrence order kept.
    // page_size <= 0 selects kDefaultPageSize.
    explicit CurrencyRepo(const std::vector<std::string>& currencies = {},
                          int page_size = kDefaultPageSize);

    // 1-based page. With a filter, the window is applied to the entries whose
    // upper-cased form contains the upper-cased filter. Out of range -> empty.
    std::vector<std::string> get(int page,
                                 const std::optional<std::string>& filter = std::nullopt) const;

    int get_page_size() const { return page_size_; }
    int get_page_count() const;
    std::size_t size() const { return currencies_.size(); }

private:
    std::vector<std::string> currencies_;
    int page_size_ = kDefaultPageSize;
};
