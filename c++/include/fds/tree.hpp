#ifndef FDS_TREE_HPP
#define FDS_TREE_HPP

#include <algorithm>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/variant.hpp>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "result_of.hpp"

namespace fds {

// Persistent binary tree
//
//   Tree<T> = Leaf(value: T) | Branch(left: Tree<T>, right: Tree<T>)
//
// Subtrees are shared and never modified. fold() walks the tree with an
// explicit work stack; size, depth, maximum and map are all folds.

template <typename T>
struct Leaf {
    T value;
};

template <typename T>
struct Branch;

template <typename T>
class Tree {
public:
    typedef T value_type;
    typedef boost::shared_ptr<Branch<T>> Link;
    typedef boost::variant<Leaf<T>, Link> Node;

    Tree(const Leaf<T>& leaf) : node_(leaf) {}
    Tree(const Tree& left, const Tree& right) : node_(Link(boost::make_shared<Branch<T>>(left, right))) {}
    Tree(const Tree&) = default;
    Tree(Tree&&) = default;
    Tree& operator=(const Tree&) = default;
    Tree& operator=(Tree&&) = default;
    ~Tree();

    const Leaf<T>* leaf() const { return boost::get<Leaf<T>>(&node_); }

    const Branch<T>* branch() const {
        const Link* link = boost::get<Link>(&node_);
        return link ? link->get() : nullptr;
    }

    const Node& node() const { return node_; }

private:
    static void detach(Node& node, std::vector<Link>& pending);

    Node node_;
};

template <typename T>
struct Branch {
    Branch(const Tree<T>& left, const Tree<T>& right) : left(left), right(right) {}

    Tree<T> left;
    Tree<T> right;
};

template <typename T>
void Tree<T>::detach(Node& node, std::vector<Link>& pending) {
    Link* link = boost::get<Link>(&node);
    if (link && *link) {
        pending.push_back(Link());
        pending.back().swap(*link);
    }
}

template <typename T>
Tree<T>::~Tree() {
    // Branches owned only by this tree are taken apart level by level from a
    // work list instead of through nested destructor calls. A leaf or a
    // shared branch needs no work list.
    Link* root = boost::get<Link>(&node_);
    if (!root || root->use_count() != 1)
        return;
    std::vector<Link> pending;
    detach(node_, pending);
    while (!pending.empty()) {
        Link b = pending.back();
        pending.pop_back();
        if (b.use_count() == 1) {
            detach(b->left.node_, pending);
            detach(b->right.node_, pending);
        }
    }
}

template <typename T>
Tree<T> leaf(const T& value) {
    return Tree<T>(Leaf<T>{value});
}

template <typename T>
Tree<T> branch(const Tree<T>& left, const Tree<T>& right) {
    return Tree<T>(left, right);
}

namespace detail {

// One step of fold(): a leaf yields a result, a branch is expanded into its
// children followed by a combine marker.
template <typename T, typename R, typename L>
class FoldStep : public boost::static_visitor<void> {
public:
    struct Frame {
        const Tree<T>* tree;
        bool combine;
    };

    FoldStep(std::vector<Frame>& todo, std::vector<R>& results, L& leafFn)
        : todo_(todo), results_(results), leafFn_(leafFn) {}

    void operator()(const Leaf<T>& leaf) const { results_.push_back(leafFn_(leaf.value)); }

    void operator()(const boost::shared_ptr<Branch<T>>& b) const {
        todo_.push_back(Frame{nullptr, true});
        todo_.push_back(Frame{&b->right, false});
        todo_.push_back(Frame{&b->left, false});
    }

private:
    std::vector<Frame>& todo_;
    std::vector<R>& results_;
    L& leafFn_;
};

} // namespace detail

// leafFn(value) at each leaf, branchFn(left result, right result) at each
// branch.
template <typename T, typename L, typename B>
ResultOf<L, const T&> fold(const Tree<T>& tree, L leafFn, B branchFn) {
    typedef ResultOf<L, const T&> R;
    typedef detail::FoldStep<T, R, L> Step;

    std::vector<typename Step::Frame> todo;
    std::vector<R> results;
    Step step(todo, results, leafFn);

    todo.push_back(typename Step::Frame{&tree, false});
    while (!todo.empty()) {
        typename Step::Frame frame = todo.back();
        todo.pop_back();
        if (!frame.combine) {
            boost::apply_visitor(step, frame.tree->node());
            continue;
        }
        R right = std::move(results.back());
        results.pop_back();
        R left = std::move(results.back());
        results.pop_back();
        results.push_back(branchFn(std::move(left), std::move(right)));
    }
    return std::move(results.back());
}

// Counts leaves and branches alike.
template <typename T>
int size(const Tree<T>& tree) {
    return fold(tree, [](const T&) { return 1; }, [](int l, int r) { return 1 + l + r; });
}

template <typename T>
int depth(const Tree<T>& tree) {
    return fold(tree, [](const T&) { return 0; }, [](int l, int r) { return 1 + std::max(l, r); });
}

template <typename T>
T maximum(const Tree<T>& tree) {
    return fold(tree, [](const T& v) { return v; }, [](const T& l, const T& r) { return std::max(l, r); });
}

template <typename T, typename F>
Tree<ResultOf<F, const T&>> map(const Tree<T>& tree, F f) {
    typedef ResultOf<F, const T&> U;
    return fold(tree,
                [&f](const T& v) { return leaf<U>(f(v)); },
                [](const Tree<U>& l, const Tree<U>& r) { return branch(l, r); });
}

template <typename T>
bool operator==(const Tree<T>& a, const Tree<T>& b) {
    std::vector<std::pair<const Tree<T>*, const Tree<T>*>> todo;
    todo.push_back(std::make_pair(&a, &b));
    while (!todo.empty()) {
        const Tree<T>* x = todo.back().first;
        const Tree<T>* y = todo.back().second;
        todo.pop_back();
        if (const Leaf<T>* lx = x->leaf()) {
            const Leaf<T>* ly = y->leaf();
            if (!ly || !(lx->value == ly->value))
                return false;
            continue;
        }
        const Branch<T>* bx = x->branch();
        const Branch<T>* by = y->branch();
        if (!by)
            return false;
        if (bx == by)
            continue;
        todo.push_back(std::make_pair(&bx->right, &by->right));
        todo.push_back(std::make_pair(&bx->left, &by->left));
    }
    return true;
}

template <typename T>
bool operator!=(const Tree<T>& a, const Tree<T>& b) {
    return !(a == b);
}

template <typename T>
std::ostream& operator<<(std::ostream& os, const Tree<T>& tree) {
    return os << fold(tree,
                      [](const T& v) {
                          std::ostringstream out;
                          out << "Leaf(" << v << ")";
                          return out.str();
                      },
                      [](const std::string& l, const std::string& r) { return "Branch(" + l + ", " + r + ")"; });
}

} // namespace fds

#endif
