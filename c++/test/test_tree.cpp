#define BOOST_TEST_MODULE fds_tree
#include <boost/test/unit_test.hpp>

#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "fds/tree.hpp"

using fds::Tree;
using fds::branch;
using fds::leaf;

namespace {

// Branch(Leaf(1), Branch(Leaf(2), Leaf(4)))
Tree<int> sample() {
    return branch(leaf(1), branch(leaf(2), leaf(4)));
}

// Right-leaning spine of n branches.
Tree<int> spine(int n) {
    Tree<int> t = leaf(n);
    for (int i = n - 1; i >= 0; --i)
        t = branch(leaf(i), t);
    return t;
}

} // namespace

BOOST_AUTO_TEST_CASE(single_leaf) {
    BOOST_TEST(fds::size(leaf(1)) == 1);
    BOOST_TEST(fds::depth(leaf(1)) == 0);
    BOOST_TEST(fds::maximum(leaf(5)) == 5);
    BOOST_TEST(fds::map(leaf(2), [](int x) { return x + 1; }) == leaf(3));
}

BOOST_AUTO_TEST_CASE(size_counts_every_node) {
    BOOST_TEST(fds::size(sample()) == 5);
    BOOST_TEST(fds::size(branch(leaf(0), leaf(0))) == 3);
}

BOOST_AUTO_TEST_CASE(depth_is_longest_path) {
    BOOST_TEST(fds::depth(sample()) == 2);
    BOOST_TEST(fds::depth(branch(branch(branch(leaf(1), leaf(2)), leaf(3)), leaf(4))) == 3);
}

BOOST_AUTO_TEST_CASE(maximum_over_leaves) {
    BOOST_TEST(fds::maximum(sample()) == 4);
    BOOST_TEST(fds::maximum(branch(leaf(9), branch(leaf(-2), leaf(4)))) == 9);
    BOOST_TEST(fds::maximum(branch(leaf(-7), leaf(-3))) == -3);
}

BOOST_AUTO_TEST_CASE(map_keeps_shape) {
    Tree<int> t = sample();
    BOOST_TEST(fds::map(t, [](int x) { return x + 1; }) == branch(leaf(2), branch(leaf(3), leaf(5))));
    BOOST_TEST(t == sample());

    Tree<std::string> shown = fds::map(t, [](int x) { return std::to_string(x * 10); });
    BOOST_TEST(shown == branch(leaf(std::string("10")), branch(leaf(std::string("20")), leaf(std::string("40")))));
}

BOOST_AUTO_TEST_CASE(fold_visits_left_before_right) {
    std::string order = fds::fold(
        sample(),
        [](int v) { return std::to_string(v); },
        [](const std::string& l, const std::string& r) { return l + r; });
    BOOST_TEST(order == "124");

    int leaves = fds::fold(sample(), [](int) { return 1; }, [](int l, int r) { return l + r; });
    BOOST_TEST(leaves == 3);
}

BOOST_AUTO_TEST_CASE(equality_compares_shape_and_values) {
    BOOST_TEST(sample() == sample());
    BOOST_TEST(leaf(1) != branch(leaf(1), leaf(1)));
    BOOST_TEST(branch(leaf(1), leaf(1)) != leaf(1));
    BOOST_TEST(branch(leaf(1), leaf(2)) != branch(leaf(2), leaf(1)));
}

BOOST_AUTO_TEST_CASE(printing) {
    std::ostringstream out;
    out << sample();
    BOOST_TEST(out.str() == "Branch(Leaf(1), Branch(Leaf(2), Leaf(4)))");
}

BOOST_AUTO_TEST_CASE(subtrees_are_shared) {
    Tree<int> right = branch(leaf(2), leaf(4));
    Tree<int> t = branch(leaf(1), right);
    BOOST_REQUIRE(t.branch());
    BOOST_TEST(t.branch()->right.branch() == right.branch());
}

BOOST_AUTO_TEST_CASE(destroying_parent_keeps_shared_subtree) {
    Tree<int> shared = branch(leaf(2), branch(leaf(3), leaf(4)));
    {
        Tree<int> parent = branch(leaf(1), shared);
        Tree<int> copy = parent;
    }
    BOOST_TEST(shared == branch(leaf(2), branch(leaf(3), leaf(4))));
    BOOST_TEST(fds::size(shared) == 5);
}

BOOST_AUTO_TEST_CASE(move_transfers_branch) {
    Tree<int> t = sample();
    const fds::Branch<int>* root = t.branch();
    Tree<int> u(std::move(t));
    BOOST_TEST(u.branch() == root);
    BOOST_TEST(t.branch() == nullptr);

    Tree<int> v = leaf(0);
    v = std::move(u);
    BOOST_TEST(v.branch() == root);
    BOOST_TEST(v == sample());
}

BOOST_AUTO_TEST_CASE(deep_trees) {
    const int n = 200000;
    Tree<int> t = spine(n);
    BOOST_TEST(fds::size(t) == 2 * n + 1);
    BOOST_TEST(fds::depth(t) == n);
    BOOST_TEST(fds::maximum(t) == n);
    BOOST_TEST(fds::depth(fds::map(t, [](int x) { return x * 2; })) == n);
    BOOST_TEST(fds::maximum(fds::map(t, [](int x) { return x * 2; })) == 2 * n);
}
