#pragma once
/*
 * Markup
 *
 * Purpose: turn the restricted markup subset (<b>, <u>, <r> and long forms,
 *          &lt; &gt; &amp;) into a StyledLine.
 * Note: unknown or unterminated tags come through as literal text.
 */
#include <string>
#include "styled_text.hpp"

StyledLine highlight(const std::string& markup);
std::string sanitize(const std::string& text);
std::string unsanitize(const std::string& text);
