/** \file    ContentInspector.cc
 *  \brief   Implementation of the content inspectors.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "ContentInspector.h"
#include <algorithm>
#include <stdexcept>
#include <utility>
#include "MediaTypeUtil.h"
#include "StringUtil.h"
#include "TextUtil.h"
#include "util.h"


std::string ContentTypeToString(const ContentType content_type) {
    switch (content_type) {
    case ContentType::BINARY:
        return "binary";
    case ContentType::UTF_8:
        return "UTF-8";
    case ContentType::UTF_8_BOM:
        return "UTF-8-BOM";
    case ContentType::UTF_16LE:
        return "UTF-16LE";
    case ContentType::UTF_16BE:
        return "UTF-16BE";
    case ContentType::UTF_32LE:
        return "UTF-32LE";
    case ContentType::UTF_32BE:
        return "UTF-32BE";
    }

    throw std::runtime_error("in ContentTypeToString: unknown content type " + std::to_string(static_cast<int>(content_type)) + "!");
}


bool IsTextContentType(const ContentType content_type) {
    return content_type == ContentType::UTF_8 or content_type == ContentType::UTF_8_BOM or content_type == ContentType::UTF_16LE
           or content_type == ContentType::UTF_16BE;
}


namespace {


// The order matters: the UTF-32LE BOM starts w/ the UTF-16LE BOM.
const std::pair<const std::string &, ContentType> BYTE_ORDER_MARKS[] = {
    { TextUtil::UTF32LE_BOM, ContentType::UTF_32LE }, { TextUtil::UTF32BE_BOM, ContentType::UTF_32BE },
    { TextUtil::UTF8_BOM, ContentType::UTF_8_BOM },   { TextUtil::UTF16LE_BOM, ContentType::UTF_16LE },
    { TextUtil::UTF16BE_BOM, ContentType::UTF_16BE },
};


bool GetContentTypeFromByteOrderMark(const std::string &sample, ContentType * const content_type) {
    for (const auto &bom_and_content_type : BYTE_ORDER_MARKS) {
        if (StringUtil::StartsWith(sample, bom_and_content_type.first)) {
            *content_type = bom_and_content_type.second;
            return true;
        }
    }

    return false;
}


const std::string BINARY_MAGIC_NUMBERS[] = { "%PDF", "\x89PNG" };


} // unnamed namespace


std::unique_ptr<ContentInspector> ContentInspector::Factory(const InspectorType inspector_type) {
    switch (inspector_type) {
    case HEURISTIC:
        return std::unique_ptr<ContentInspector>(new HeuristicContentInspector());
    case LIBMAGIC:
        return std::unique_ptr<ContentInspector>(new LibmagicContentInspector());
    }

    throw std::runtime_error("in ContentInspector::Factory: unknown inspector type " + std::to_string(inspector_type) + "!");
}


std::unique_ptr<ContentInspector> ContentInspector::Factory(const std::string &inspector_name) {
    if (inspector_name == "heuristic")
        return Factory(HEURISTIC);
    if (inspector_name == "libmagic")
        return Factory(LIBMAGIC);

    throw std::runtime_error("in ContentInspector::Factory: unknown inspector \"" + inspector_name + "\"! (Use heuristic or libmagic)");
}


std::string ContentInspector::InspectorTypeToString(const InspectorType inspector_type) {
    return inspector_type == HEURISTIC ? "heuristic" : "libmagic";
}


ContentType HeuristicContentInspector::inspect(const std::string &sample) const {
    ContentType content_type;
    if (GetContentTypeFromByteOrderMark(sample, &content_type))
        return content_type;

    const auto scan_end(sample.cbegin() + std::min(sample.size(), MAX_SCAN_SIZE));
    if (std::find(sample.cbegin(), scan_end, '\0') != scan_end)
        return ContentType::BINARY;

    for (const auto &magic_number : BINARY_MAGIC_NUMBERS) {
        if (StringUtil::StartsWith(sample, magic_number))
            return ContentType::BINARY;
    }

    return ContentType::UTF_8;
}


ContentType LibmagicContentInspector::inspect(const std::string &sample) const {
    ContentType content_type;
    if (GetContentTypeFromByteOrderMark(sample, &content_type))
        return content_type;

    if (sample.empty())
        return ContentType::UTF_8;

    const std::string encoding(MediaTypeUtil::GetMediaEncoding(encoding_cookie_, sample));
    if (encoding == "us-ascii" or encoding == "utf-8")
        return ContentType::UTF_8;
    if (encoding == "utf-16le")
        return ContentType::UTF_16LE;
    if (encoding == "utf-16be")
        return ContentType::UTF_16BE;

    LOG_DEBUG("libmagic reported unsupported encoding \"" + encoding + "\"!");
    return ContentType::BINARY;
}
