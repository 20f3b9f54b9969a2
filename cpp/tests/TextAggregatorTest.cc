/** \brief Test cases for TextAggregator.
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
#define BOOST_TEST_MODULE TextAggregator
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include "ContentInspector.h"
#include "File.h"
#include "FileUtil.h"
#include "TextAggregator.h"
#include "TextUtil.h"


namespace {


// Runs a TextAggregator whose working directory is a fresh temp directory and whose output goes to a second one.
// Unless another inspector is passed in, files are classified by a HeuristicContentInspector.
class AggregatorFixture {
    FileUtil::AutoTempDirectory input_dir_;
    FileUtil::AutoTempDirectory output_dir_;
    HeuristicContentInspector heuristic_inspector_;
    std::unique_ptr<File> output_;
    std::unique_ptr<TextAggregator> aggregator_;

public:
    explicit AggregatorFixture(const ContentInspector * const inspector = nullptr) {
        TextAggregator::Config config;
        config.working_directory_ = input_dir_.getDirectoryPath();
        config.output_path_ = output_dir_.getDirectoryPath() + "/output.txt";
        output_.reset(new File(config.output_path_, "w"));
        aggregator_.reset(new TextAggregator(config, output_.get(), inspector == nullptr ? heuristic_inspector_ : *inspector));
    }

    const std::string &root() const { return input_dir_.getDirectoryPath(); }
    TextAggregator &aggregator() { return *aggregator_; }
    const TextAggregator::Statistics &statistics() const { return aggregator_->getStatistics(); }

    void addFile(const std::string &relative_path, const std::string &contents) {
        const auto last_slash(relative_path.rfind('/'));
        if (last_slash != std::string::npos)
            FileUtil::MakeDirectoryOrDie(root() + "/" + relative_path.substr(0, last_slash), /* recursive = */ true);
        FileUtil::WriteStringOrDie(root() + "/" + relative_path, contents);
    }

    std::string output() {
        output_->flush();
        return FileUtil::ReadStringOrDie(aggregator_->getConfig().output_path_);
    }
};


std::string Block(const std::string &display_path, const std::string &contents) {
    return "<" + display_path + ">\n" + contents + "\n</" + display_path + ">\n\n";
}


// Fails like a libmagic whose classification breaks down for samples starting w/ "broken".
class FailingContentInspector final : public ContentInspector {
public:
    InspectorType getType() const override { return LIBMAGIC; }

    ContentType inspect(const std::string &sample) const override {
        if (sample.compare(0, 6, "broken") == 0)
            throw std::runtime_error("in FailingContentInspector::inspect: error in libmagic (simulated).");
        return ContentType::UTF_8;
    }
};


void MakeFIFOOrDie(const std::string &path) {
    if (::mkfifo(path.c_str(), 0600) != 0)
        throw std::runtime_error("in MakeFIFOOrDie: can't create \"" + path + "\"!");
}


} // unnamed namespace


BOOST_AUTO_TEST_CASE(MixedContent) {
    AggregatorFixture fixture;
    fixture.addFile("tree/notes.txt", "hello\n");
    fixture.addFile("tree/blob.bin", std::string("\x01\x02\0\x03", 4));
    fixture.addFile("tree/.git/config", "[core]\n");

    fixture.aggregator().processPath(fixture.root() + "/tree");
    BOOST_CHECK_EQUAL(fixture.output(), Block("tree/notes.txt", "hello\n"));
    BOOST_CHECK_EQUAL(fixture.statistics().emitted_count_, 1u);
    BOOST_CHECK_EQUAL(fixture.statistics().non_text_count_, 1u);
    BOOST_CHECK_EQUAL(fixture.statistics().excluded_count_, 1u);
    BOOST_CHECK_EQUAL(fixture.statistics().failure_count_, 0u);
}


BOOST_AUTO_TEST_CASE(EmptyFile) {
    AggregatorFixture fixture;
    fixture.addFile("empty.txt", "");

    BOOST_CHECK(fixture.aggregator().emitFile(fixture.root() + "/empty.txt"));
    BOOST_CHECK_EQUAL(fixture.output(), "<empty.txt>\n\n</empty.txt>\n\n");
}


BOOST_AUTO_TEST_CASE(MissingPathAndValidFile) {
    AggregatorFixture fixture;
    fixture.addFile("valid.txt", "valid");

    fixture.aggregator().processPath(fixture.root() + "/does_not_exist");
    fixture.aggregator().processPath(fixture.root() + "/valid.txt");
    BOOST_CHECK_EQUAL(fixture.output(), Block("valid.txt", "valid"));
    BOOST_CHECK_EQUAL(fixture.statistics().failure_count_, 1u);
    BOOST_CHECK_EQUAL(fixture.statistics().emitted_count_, 1u);
}


BOOST_AUTO_TEST_CASE(BlocksFollowArgumentOrder) {
    AggregatorFixture fixture;
    fixture.addFile("b.txt", "second");
    fixture.addFile("a.txt", "first");

    fixture.aggregator().processPath(fixture.root() + "/b.txt");
    fixture.aggregator().processPath(fixture.root() + "/a.txt");
    BOOST_CHECK_EQUAL(fixture.output(), Block("b.txt", "second") + Block("a.txt", "first"));
}


BOOST_AUTO_TEST_CASE(ExplicitFileInExcludedDirectory) {
    AggregatorFixture fixture;
    fixture.addFile(".git/description", "unnamed repository\n");

    fixture.aggregator().processPath(fixture.root() + "/.git/description");
    BOOST_CHECK_EQUAL(fixture.output(), Block(".git/description", "unnamed repository\n"));
}


BOOST_AUTO_TEST_CASE(UTF16IsCopiedVerbatim) {
    AggregatorFixture fixture;
    const std::string utf16le(TextUtil::UTF16LE_BOM + std::string("h\0i\0\n\0", 6));
    const std::string utf16be(TextUtil::UTF16BE_BOM + std::string("\0h\0i", 4));
    fixture.addFile("le.txt", utf16le);
    fixture.addFile("be.txt", utf16be);

    BOOST_CHECK(fixture.aggregator().emitFile(fixture.root() + "/le.txt"));
    BOOST_CHECK(fixture.aggregator().emitFile(fixture.root() + "/be.txt"));
    BOOST_CHECK(fixture.output() == Block("le.txt", utf16le) + Block("be.txt", utf16be));
}


BOOST_AUTO_TEST_CASE(UTF8WithByteOrderMark) {
    AggregatorFixture fixture;
    const std::string contents(TextUtil::UTF8_BOM + "T\xC3\xBC" "bingen\n");
    fixture.addFile("bom.txt", contents);

    BOOST_CHECK(fixture.aggregator().emitFile(fixture.root() + "/bom.txt"));
    BOOST_CHECK_EQUAL(fixture.output(), Block("bom.txt", contents));
}


BOOST_AUTO_TEST_CASE(InvalidUTF8AfterTheSample) {
    AggregatorFixture fixture;
    fixture.addFile("bad.txt", std::string(600, 'a') + "\xFF\n");

    BOOST_CHECK(not fixture.aggregator().emitFile(fixture.root() + "/bad.txt"));
    BOOST_CHECK(fixture.output().empty());
    BOOST_CHECK_EQUAL(fixture.statistics().failure_count_, 1u);
}


BOOST_AUTO_TEST_CASE(LargeFileIsReadCompletely) {
    AggregatorFixture fixture;
    std::string contents;
    for (unsigned line_no(0); line_no < 5000; ++line_no)
        contents += "line " + std::to_string(line_no) + "\n";
    fixture.addFile("large.txt", contents);

    BOOST_CHECK(fixture.aggregator().emitFile(fixture.root() + "/large.txt"));
    BOOST_CHECK(fixture.output() == Block("large.txt", contents));
}


BOOST_AUTO_TEST_CASE(NonTextFilesAreSkippedSilently) {
    AggregatorFixture fixture;
    fixture.addFile("utf32.txt", TextUtil::UTF32LE_BOM + std::string("h\0\0\0", 4));
    fixture.addFile("doc.pdf", "%PDF-1.4\n");

    BOOST_CHECK(not fixture.aggregator().emitFile(fixture.root() + "/utf32.txt"));
    BOOST_CHECK(not fixture.aggregator().emitFile(fixture.root() + "/doc.pdf"));
    BOOST_CHECK(fixture.output().empty());
    BOOST_CHECK_EQUAL(fixture.statistics().non_text_count_, 2u);
    BOOST_CHECK_EQUAL(fixture.statistics().failure_count_, 0u);
}


BOOST_AUTO_TEST_CASE(DanglingSymlinkInDirectory) {
    AggregatorFixture fixture;
    fixture.addFile("dir/ok.txt", "ok");
    FileUtil::CreateSymlinkOrDie(fixture.root() + "/nowhere", fixture.root() + "/dir/dangling");

    fixture.aggregator().processPath(fixture.root() + "/dir");
    BOOST_CHECK_EQUAL(fixture.output(), Block("dir/ok.txt", "ok"));
    BOOST_CHECK_EQUAL(fixture.statistics().failure_count_, 1u);
}


BOOST_AUTO_TEST_CASE(InspectorFailureIsCountedAndTheRunContinues) {
    FailingContentInspector inspector;
    AggregatorFixture fixture(&inspector);
    fixture.addFile("broken.txt", "broken sample\n");
    fixture.addFile("fine.txt", "fine\n");

    BOOST_CHECK(not fixture.aggregator().emitFile(fixture.root() + "/broken.txt"));
    fixture.aggregator().processPath(fixture.root() + "/fine.txt");
    BOOST_CHECK_EQUAL(fixture.output(), Block("fine.txt", "fine\n"));
    BOOST_CHECK_EQUAL(fixture.statistics().failure_count_, 1u);
    BOOST_CHECK_EQUAL(fixture.statistics().emitted_count_, 1u);
}


BOOST_AUTO_TEST_CASE(InspectorFailureInsideADirectory) {
    FailingContentInspector inspector;
    AggregatorFixture fixture(&inspector);
    fixture.addFile("dir/broken.txt", "broken sample\n");

    fixture.aggregator().processPath(fixture.root() + "/dir");
    BOOST_CHECK(fixture.output().empty());
    BOOST_CHECK_EQUAL(fixture.statistics().failure_count_, 1u);
    BOOST_CHECK_EQUAL(fixture.statistics().emitted_count_, 0u);
}


BOOST_AUTO_TEST_CASE(FIFOArgumentIsNeverOpened) {
    AggregatorFixture fixture;
    fixture.addFile("after.txt", "after");
    MakeFIFOOrDie(fixture.root() + "/pipe");

    // Opening the FIFO for reading would block forever since there is no writer.
    fixture.aggregator().processPath(fixture.root() + "/pipe");
    fixture.aggregator().processPath(fixture.root() + "/after.txt");
    BOOST_CHECK_EQUAL(fixture.output(), Block("after.txt", "after"));
    BOOST_CHECK_EQUAL(fixture.statistics().failure_count_, 1u);
    BOOST_CHECK_EQUAL(fixture.statistics().emitted_count_, 1u);
}


BOOST_AUTO_TEST_CASE(FIFOInsideADirectory) {
    AggregatorFixture fixture;
    fixture.addFile("dir/a.txt", "a");
    MakeFIFOOrDie(fixture.root() + "/dir/pipe");

    fixture.aggregator().processPath(fixture.root() + "/dir");
    BOOST_CHECK_EQUAL(fixture.output(), Block("dir/a.txt", "a"));
    BOOST_CHECK_EQUAL(fixture.statistics().failure_count_, 1u);
    BOOST_CHECK_EQUAL(fixture.statistics().emitted_count_, 1u);
}


BOOST_AUTO_TEST_CASE(MakeDisplayPath) {
    BOOST_CHECK_EQUAL(TextAggregator::MakeDisplayPath("/home/user/project/a.txt", "/home/user/project"), "a.txt");
    BOOST_CHECK_EQUAL(TextAggregator::MakeDisplayPath("/home/user/./project//a.txt", "/home/user/"), "project/a.txt");
    BOOST_CHECK_EQUAL(TextAggregator::MakeDisplayPath("src/a.txt", "/home/user"), "src/a.txt");
    BOOST_CHECK_EQUAL(TextAggregator::MakeDisplayPath("../other/a.txt", "/home/user"), "../other/a.txt");
    BOOST_CHECK_EQUAL(TextAggregator::MakeDisplayPath("/etc/hosts", "/home/user"), "/etc/hosts");
    BOOST_CHECK_EQUAL(TextAggregator::MakeDisplayPath("/home/username/a.txt", "/home/user"), "/home/username/a.txt");
}
