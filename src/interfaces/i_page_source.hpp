#pragma once

#include <functional>
#include <string>
#include <vector>

namespace lazylist {

template <typename T>
struct PageResult {
    bool success = false;
    std::vector<T> items;        // empty or shorter than page_size = exhausted
    std::string error_message;   // set when !success
};

template <typename T>
using PageCallback = std::function<void(PageResult<T>)>;

// Produces the next page of a collection. The source owns its cursor
// (offset, page number, continuation token); load_more takes no arguments.
//
// The callback must be invoked exactly once, on the UI thread. It may be
// invoked before load_more returns.
template <typename T>
class IPageSource {
public:
    virtual ~IPageSource() = default;

    virtual void load_more(PageCallback<T> callback) = 0;
};

} // namespace lazylist
