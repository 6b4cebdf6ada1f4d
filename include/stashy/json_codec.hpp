#pragma once

#include <stashy/result.hpp>
#include <stashy/types.hpp>

#include <string>
#include <vector>

namespace stashy {

/**
 * Response body decoding. Field names are accepted in both the current
 * ("files", "visibility") and legacy ("fragments", "is_public") forms.
 * Any structural problem yields INVALID_RESPONSE.
 */
Result<Snippet> parse_snippet(const std::string& body);

/**
 * Decode a listing page. Missing page/page_size fall back to the values
 * that were requested; a missing total means "this page is everything".
 */
Result<Page> parse_page(const std::string& body, uint32_t requested_page,
                        uint32_t requested_size);

// Search results: a bare array, or an object with "items"/"snippets"
Result<std::vector<Snippet>> parse_snippet_list(const std::string& body);

// Best-effort human message from an error body ("error" or "message" field)
std::string error_detail(const std::string& body);

}  // namespace stashy
