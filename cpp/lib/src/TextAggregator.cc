/** \file    TextAggregator.cc
 *  \brief   Implementation of class TextAggregator.
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
#include "TextAggregator.h"
#include <stdexcept>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include "FileUtil.h"
#include "TextUtil.h"
#include "TreeWalker.h"
#include "util.h"


std::string TextAggregator::Statistics::toString() const {
    return "emitted " + std::to_string(emitted_count_) + " file(s), skipped " + std::to_string(non_text_count_)
           + " non-text file(s), excluded " + std::to_string(excluded_count_) + " entr(y|ies), encountered "
           + std::to_string(failure_count_) + " failure(s)";
}


TextAggregator::TextAggregator(const Config &config, File * const output, const ContentInspector &inspector)
    : config_(config), output_(output), content_inspector_(inspector)
{
    if (unlikely(output_ == nullptr or not output_->isOpen()))
        throw std::runtime_error("in TextAggregator::TextAggregator: the output file must be open!");
}


void TextAggregator::processPath(const std::string &path) {
    std::string error_message;
    if (not FileUtil::Exists(path, &error_message)) {
        LOG_WARNING("skipping \"" + path + "\": " + error_message);
        ++statistics_.failure_count_;
        return;
    }

    if (FileUtil::IsDirectory(path))
        processDirectory(path);
    else if (FileUtil::IsRegularFile(path))
        emitFile(path);
    else {
        LOG_WARNING("skipping \"" + path + "\": neither a regular file nor a directory!");
        ++statistics_.failure_count_;
    }
}


void TextAggregator::processDirectory(const std::string &directory_path) {
    TreeWalker walker(directory_path, config_.excluded_directory_names_);
    std::string path;
    while (walker.getNext(&path)) {
        // Dangling symlinks are left to emitFile() which will report them.
        if (FileUtil::Exists(path) and not FileUtil::IsRegularFile(path)) {
            LOG_WARNING("skipping \"" + path + "\": not a regular file!");
            ++statistics_.failure_count_;
            continue;
        }
        emitFile(path);
    }

    statistics_.excluded_count_ += walker.getExcludedCount();
}


bool TextAggregator::emitFile(const std::string &path) {
    File input(path, "r");
    if (input.fail()) {
        LOG_WARNING("can't open \"" + path + "\" for reading: " + std::string(std::strerror(errno)));
        ++statistics_.failure_count_;
        return false;
    }

    std::string content;
    if (not readSample(&input, &content)) {
        LOG_WARNING("can't read from \"" + path + "\": " + std::string(std::strerror(errno)));
        ++statistics_.failure_count_;
        return false;
    }

    ContentType content_type;
    try {
        content_type = content_inspector_.inspect(content);
    } catch (const std::runtime_error &x) {
        LOG_WARNING("can't classify \"" + path + "\": " + std::string(x.what()));
        ++statistics_.failure_count_;
        return false;
    }

    if (not IsTextContentType(content_type)) {
        LOG_DEBUG("skipping \"" + path + "\" with content type " + ContentTypeToString(content_type) + ".");
        ++statistics_.non_text_count_;
        return false;
    }

    if (content.size() == config_.sample_size_) {
        char buf[BUFSIZ];
        size_t count;
        while ((count = input.read(buf, sizeof(buf))) > 0)
            content.append(buf, count);
        if (unlikely(input.anErrorOccurred())) {
            LOG_WARNING("can't read from \"" + path + "\": " + std::string(std::strerror(errno)));
            ++statistics_.failure_count_;
            return false;
        }
    }

    if (not isValidContent(content_type, content)) {
        LOG_WARNING("can't decode \"" + path + "\" as " + ContentTypeToString(content_type) + "!");
        ++statistics_.failure_count_;
        return false;
    }

    const std::string display_path(MakeDisplayPath(path, config_.working_directory_));
    if (not output_->write("<" + display_path + ">\n") or not output_->write(content + "\n")
        or not output_->write("</" + display_path + ">\n\n"))
    {
        LOG_WARNING("failed to write the contents of \"" + path + "\" to \"" + output_->getPath()
                    + "\": " + std::string(std::strerror(errno)));
        ++statistics_.failure_count_;
        return false;
    }

    LOG_DEBUG("emitted \"" + display_path + "\" (" + ContentTypeToString(content_type) + ").");
    ++statistics_.emitted_count_;
    return true;
}


std::string TextAggregator::MakeDisplayPath(const std::string &path, const std::string &working_directory) {
    std::string relative_path;
    if (FileUtil::StripPathPrefix(path, working_directory, &relative_path) and not relative_path.empty())
        return relative_path;
    return path;
}


bool TextAggregator::readSample(File * const input, std::string * const sample) {
    sample->resize(config_.sample_size_);
    const size_t count(input->read(&(*sample)[0], config_.sample_size_));
    sample->resize(count);
    return count == config_.sample_size_ or not input->anErrorOccurred();
}


bool TextAggregator::isValidContent(const ContentType content_type, const std::string &content) const {
    switch (content_type) {
    case ContentType::UTF_8:
    case ContentType::UTF_8_BOM:
        return TextUtil::IsValidUTF8(content);
    case ContentType::UTF_16LE:
        return TextUtil::IsValidUTF16(content, TextUtil::ByteOrder::LITTLE_ENDIAN_ORDER);
    case ContentType::UTF_16BE:
        return TextUtil::IsValidUTF16(content, TextUtil::ByteOrder::BIG_ENDIAN_ORDER);
    default:
        return false;
    }
}
