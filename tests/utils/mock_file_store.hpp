#ifndef TESTUTILS_MOCKFILESTORE_HPP
#define TESTUTILS_MOCKFILESTORE_HPP

#include <map>
#include <memory>
#include <string>

#include "item_tree/item_tree.hpp"
#include "test_utils.hpp"
#include "utils/error.hpp"

// File store keeping the trees in memory, indexed by path. Written trees are
// deep copied, so they can be read back after the writer closed them.
struct MockFileStore : public ItemTree::FileStore {
    std::map<std::string, std::unique_ptr<ItemTree::Object>> files;

    std::unique_ptr<ItemTree::Object> read_file(
        const std::string &path) override {
        auto it = files.find(path);
        if (it == files.end()) {
            throw Error::StoreError(path, "no such file");
        }
        return TestUtils::copy_object(*it->second);
    }

    void write_file(const ItemTree::Object &tree,
                    const std::string &path) override {
        files[path] = TestUtils::copy_object(tree);
    }
};

#endif /* TESTUTILS_MOCKFILESTORE_HPP */
