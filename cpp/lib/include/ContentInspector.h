/** \file    ContentInspector.h
 *  \brief   Classification of byte samples as text in a known encoding or as binary data.
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
#pragma once


#include <memory>
#include <string>
#include "MediaTypeUtil.h"


enum class ContentType { BINARY, UTF_8, UTF_8_BOM, UTF_16LE, UTF_16BE, UTF_32LE, UTF_32BE };


std::string ContentTypeToString(const ContentType content_type);


/** \return True for UTF-8 w/ or w/o BOM and for both UTF-16 byte orders. */
bool IsTextContentType(const ContentType content_type);


/** \class ContentInspector
 *  \brief Maps a leading sample of a file to a ContentType.
 */
class ContentInspector {
public:
    enum InspectorType { HEURISTIC, LIBMAGIC };

protected:
    ContentInspector() = default;

public:
    virtual ~ContentInspector() = default;

    virtual InspectorType getType() const = 0;

    /** \param sample  The first few hundred bytes of a file, possibly fewer or none.
     *  \throws std::runtime_error if the underlying classifier fails.
     */
    virtual ContentType inspect(const std::string &sample) const = 0;

    static std::unique_ptr<ContentInspector> Factory(const InspectorType inspector_type);

    /** \param inspector_name  "heuristic" or "libmagic".
     *  \throws std::runtime_error if "inspector_name" is neither or if the chosen inspector can't be initialised.
     */
    static std::unique_ptr<ContentInspector> Factory(const std::string &inspector_name);

    static std::string InspectorTypeToString(const InspectorType inspector_type);
};


/** \class HeuristicContentInspector
 *  \brief Byte-order marks first, then NUL bytes and a couple of well-known binary magic numbers.  Everything else is UTF-8.
 *  \note  An empty sample is classified as UTF-8.
 */
class HeuristicContentInspector final : public ContentInspector {
public:
    // Only this many leading bytes of a sample are searched for NUL bytes.
    static constexpr size_t MAX_SCAN_SIZE = 1024;

public:
    HeuristicContentInspector() = default;
    InspectorType getType() const override { return HEURISTIC; }
    ContentType inspect(const std::string &sample) const override;
};


/** \class LibmagicContentInspector
 *  \brief Byte-order marks first, then whatever character encoding libmagic reports.
 *  \note  An empty sample is classified as UTF-8, encodings we don't support (e.g. ISO-8859-1) as binary.  The libmagic
 *         database is loaded when an instance is constructed.
 */
class LibmagicContentInspector final : public ContentInspector {
    MediaTypeUtil::MagicCookie encoding_cookie_;

public:
    /** \throws std::runtime_error if libmagic or its "magic" database can't be loaded. */
    LibmagicContentInspector(): encoding_cookie_(MAGIC_MIME_ENCODING) { }
    InspectorType getType() const override { return LIBMAGIC; }
    ContentType inspect(const std::string &sample) const override;
};
