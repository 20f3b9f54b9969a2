/** \brief Test cases for TreeWalker.
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
#define BOOST_TEST_MODULE TreeWalker
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include <set>
#include <string>
#include "FileUtil.h"
#include "TreeWalker.h"


namespace {


const std::set<std::string> DEFAULT_EXCLUSIONS{ ".git" };


std::set<std::string> Walk(TreeWalker * const walker) {
    std::set<std::string> paths;
    std::string path;
    while (walker->getNext(&path))
        BOOST_CHECK(paths.insert(path).second);
    return paths;
}


//  root/
//      a.txt
//      .git/HEAD
//      sub/b.txt
//      sub/.git/config
//      sub/deep/c.txt
//      sub/deep/.git/objects/blob
//      sub/.gitignore
//      empty/
void CreateTree(const std::string &root) {
    FileUtil::MakeDirectoryOrDie(root + "/.git");
    FileUtil::MakeDirectoryOrDie(root + "/sub/.git", /* recursive = */ true);
    FileUtil::MakeDirectoryOrDie(root + "/sub/deep/.git/objects", /* recursive = */ true);
    FileUtil::MakeDirectoryOrDie(root + "/empty");

    FileUtil::WriteStringOrDie(root + "/a.txt", "a\n");
    FileUtil::WriteStringOrDie(root + "/.git/HEAD", "ref: refs/heads/master\n");
    FileUtil::WriteStringOrDie(root + "/sub/b.txt", "b\n");
    FileUtil::WriteStringOrDie(root + "/sub/.git/config", "[core]\n");
    FileUtil::WriteStringOrDie(root + "/sub/deep/c.txt", "c\n");
    FileUtil::WriteStringOrDie(root + "/sub/deep/.git/objects/blob", "blob\n");
    FileUtil::WriteStringOrDie(root + "/sub/.gitignore", "*.o\n");
}


} // unnamed namespace


BOOST_AUTO_TEST_CASE(ExcludedDirectoriesAtAnyDepth) {
    const FileUtil::AutoTempDirectory temp_dir;
    const std::string &root(temp_dir.getDirectoryPath());
    CreateTree(root);

    TreeWalker walker(root, DEFAULT_EXCLUSIONS);
    const std::set<std::string> expected{ root + "/a.txt", root + "/sub/b.txt", root + "/sub/deep/c.txt", root + "/sub/.gitignore" };
    const auto actual(Walk(&walker));
    BOOST_CHECK_EQUAL_COLLECTIONS(actual.cbegin(), actual.cend(), expected.cbegin(), expected.cend());
    BOOST_CHECK_EQUAL(walker.getExcludedCount(), 3u);
}


BOOST_AUTO_TEST_CASE(NoExclusions) {
    const FileUtil::AutoTempDirectory temp_dir;
    const std::string &root(temp_dir.getDirectoryPath());
    CreateTree(root);

    TreeWalker walker(root, {});
    BOOST_CHECK_EQUAL(Walk(&walker).size(), 7u);
    BOOST_CHECK_EQUAL(walker.getExcludedCount(), 0u);
}


BOOST_AUTO_TEST_CASE(RootInsideExcludedDirectory) {
    const FileUtil::AutoTempDirectory temp_dir;
    const std::string &root(temp_dir.getDirectoryPath());
    CreateTree(root);

    TreeWalker walker(root + "/sub/.git", DEFAULT_EXCLUSIONS);
    BOOST_CHECK(Walk(&walker).empty());
    BOOST_CHECK_EQUAL(walker.getExcludedCount(), 1u);
}


BOOST_AUTO_TEST_CASE(Symlinks) {
    const FileUtil::AutoTempDirectory temp_dir;
    const std::string &root(temp_dir.getDirectoryPath());
    FileUtil::MakeDirectoryOrDie(root + "/dir");
    FileUtil::WriteStringOrDie(root + "/dir/file", "x");
    FileUtil::CreateSymlinkOrDie(root + "/dir/file", root + "/file_link");
    FileUtil::CreateSymlinkOrDie(root + "/dir", root + "/dir_link");
    FileUtil::CreateSymlinkOrDie(root + "/nowhere", root + "/dangling_link");

    TreeWalker walker(root, DEFAULT_EXCLUSIONS);
    const std::set<std::string> expected{ root + "/dangling_link", root + "/dir/file", root + "/file_link" };
    const auto actual(Walk(&walker));
    BOOST_CHECK_EQUAL_COLLECTIONS(actual.cbegin(), actual.cend(), expected.cbegin(), expected.cend());
}


BOOST_AUTO_TEST_CASE(TrailingSlashInRoot) {
    const FileUtil::AutoTempDirectory temp_dir;
    const std::string &root(temp_dir.getDirectoryPath());
    FileUtil::WriteStringOrDie(root + "/a.txt", "a\n");

    TreeWalker walker(root + "/", DEFAULT_EXCLUSIONS);
    std::string path;
    BOOST_CHECK(walker.getNext(&path));
    BOOST_CHECK_EQUAL(path, root + "/a.txt");
    BOOST_CHECK(not walker.getNext(&path));
}


BOOST_AUTO_TEST_CASE(MissingRoot) {
    const FileUtil::AutoTempDirectory temp_dir;
    TreeWalker walker(temp_dir.getDirectoryPath() + "/missing", DEFAULT_EXCLUSIONS);
    std::string path;
    BOOST_CHECK(not walker.getNext(&path));
}
