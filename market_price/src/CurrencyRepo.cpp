#include "CurrencyRepo.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_set>

static std::string to_upper_copy(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

CurrencyRepo::CurrencyRepo(const std::vector<std::string>& currencies, int page_size) {
    std::unordered_set<std::string> seen;
    currencies_.reserve(currencies.size());
    for (const auto& c : currencies) {
        if (seen.insert(c).second) currencies_.push_back(c);
    }

    if (page_size > 0) page_size_ = page_size;

    // keep page size below the instrument count, floor of 1
    const int count = static_cast<int>(currencies_.size());
    if (count > 0 && page_size_ >= count) {
        page_size_ = std::max(count - 1, 1);
    }
}

std::vector<std::string> CurrencyRepo::get(int page, const std::optional<std::string>& filter) const {
    if (page < 1) return {};

    const std::vector<std::string>* source = &currencies_;
    std::vector<std::string> filtered;
    if (filter && !filter->empty()) {
        const std::string needle = to_upper_copy(*filter);
        for (const auto& c : currencies_) {
            if (to_upper_copy(c).find(needle) != std::string::npos) filtered.push_back(c);
        }
        source = &filtered;
    }

    const std::size_t start = static_cast<std::size_t>(page - 1) * page_size_;
    if (start >= source->size()) return {};
    const std::size_t end = std::min(start + page_size_, source->size());

    return std::vector<std::string>(source->begin() + start, source->begin() + end);
}

int CurrencyRepo::get_page_count() const {
    const int count = static_cast<int>(currencies_.size());
    return (count + page_size_ - 1) / page_size_;
}
