/** \file    folder_to_text.cc
 *  \brief   Concatenates all textual files below a set of files and directories into a single tagged text file.
 */

/*
    Copyright (C) 2026 Library of the University of Tübingen

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU Affero General Public License as
    published by the Free Software Foundation, either version 3 of the
    License, or (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU Affero General Public License for more details.

    You should have received a copy of the GNU Affero General Public License
    along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#include <iostream>
#include <memory>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include "ContentInspector.h"
#include "File.h"
#include "FileUtil.h"
#include "StringUtil.h"
#include "TextAggregator.h"
#include "util.h"


namespace {


[[noreturn]] void Usage() {
    ::Usage("[--content-inspector=(heuristic|libmagic)] [--strict-exit-status] path [path ...]\n"
            "Writes the contents of all text files found at or below the given paths to \"output.txt\" in the current\n"
            "working directory.  Directories named \".git\" are skipped.\n"
            "--content-inspector: how to tell text files from binary files, the default is \"heuristic\".\n"
            "--strict-exit-status: exit w/ status 2 if any path or file could not be processed.");
}


const int EXIT_SOME_FAILURES(2);


} // unnamed namespace


int Main(int argc, char *argv[]) {
    if (argc < 2)
        Usage();

    TextAggregator::Config config;
    if (StringUtil::StartsWith(argv[1], "--content-inspector=")) {
        config.content_inspector_ = argv[1] + __builtin_strlen("--content-inspector=");
        --argc, ++argv;
    }

    bool strict_exit_status(false);
    if (argc > 1 and std::strcmp(argv[1], "--strict-exit-status") == 0) {
        strict_exit_status = true;
        --argc, ++argv;
    }

    if (argc < 2)
        Usage();

    const auto content_inspector(ContentInspector::Factory(config.content_inspector_));
    config.working_directory_ = FileUtil::GetCurrentWorkingDirectory();

    const auto output(FileUtil::OpenOutputFileOrDie(config.output_path_));
    TextAggregator text_aggregator(config, output.get(), *content_inspector);
    for (int arg_no(1); arg_no < argc; ++arg_no)
        text_aggregator.processPath(argv[arg_no]);

    if (not output->close())
        LOG_WARNING("failed to close \"" + config.output_path_ + "\": " + std::string(std::strerror(errno)));

    std::cout << "Wrote the contents of the text files to \"" << config.output_path_ << "\".\n";

    const auto &statistics(text_aggregator.getStatistics());
    LOG_INFO(statistics.toString() + " using the " + ContentInspector::InspectorTypeToString(content_inspector->getType())
             + " content inspector.");

    return (strict_exit_status and statistics.failure_count_ > 0) ? EXIT_SOME_FAILURES : EXIT_SUCCESS;
}
