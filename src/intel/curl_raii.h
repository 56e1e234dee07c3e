#pragma once

#include <curl/curl.h>
#include <memory>

struct CurlDeleter {
    void operator()(CURL* c) const noexcept {
        if (c) curl_easy_cleanup(c);
    }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* l) const noexcept {
        if (l) curl_slist_free_all(l);
    }
};

using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;
