#include <boost/function.hpp>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "fds/list.hpp"
#include "fds/tree.hpp"

using namespace fds;

typedef std::pair<std::string, boost::function<void(std::ostream&)>> Demo;

static std::vector<Demo> listDemos() {
    const List<int> xs{1, 2, 3, 4, 5};
    std::vector<Demo> demos;
    demos.push_back(Demo("Tail", [xs](std::ostream& out) { out << tail(xs); }));
    demos.push_back(Demo("Tail Nil", [](std::ostream& out) {
        try {
            out << tail(List<int>());
        } catch (const EmptyListError& e) {
            out << "error: " << e.what();
        }
    }));
    demos.push_back(Demo("Set head Nil", [](std::ostream& out) { out << setHead(List<int>(), 2); }));
    demos.push_back(Demo("Set head", [](std::ostream& out) { out << setHead(List<int>{1, 2}, 6); }));
    demos.push_back(Demo("Drop", [xs](std::ostream& out) { out << drop(xs, 3); }));
    demos.push_back(Demo("Drop Nil", [](std::ostream& out) { out << drop(List<int>(), 3); }));
    demos.push_back(Demo("Drop while", [xs](std::ostream& out) { out << dropWhile(xs, [](int x) { return x < 2; }); }));
    demos.push_back(Demo("Init", [](std::ostream& out) { out << init(List<int>{1, 2, 3, 4}); }));
    demos.push_back(Demo("Length", [](std::ostream& out) { out << length(List<int>{1, 2}); }));
    demos.push_back(Demo("Length via foldLeft", [](std::ostream& out) { out << lengthViaFoldLeft(List<int>{1, 2, 3, 6}); }));
    demos.push_back(Demo("Sum", [xs](std::ostream& out) { out << sum(xs); }));
    demos.push_back(Demo("Product", [](std::ostream& out) { out << product(List<double>{1.5, 2.0, 4.0}); }));
    demos.push_back(Demo("Reverse", [](std::ostream& out) { out << reverse(List<int>{1, 2, 3, 6}); }));
    demos.push_back(Demo("Append", [](std::ostream& out) { out << append(List<int>{1, 2, 3}, List<int>{4, 5, 6}); }));
    demos.push_back(Demo("Append via foldLeft",
                         [](std::ostream& out) { out << appendViaFoldLeft(List<int>{1, 2, 3}, List<int>{4, 5, 6}); }));
    demos.push_back(Demo("Append via foldRight",
                         [](std::ostream& out) { out << appendViaFoldRight(List<int>{1, 2, 3}, List<int>{4, 5, 6}); }));
    demos.push_back(Demo("Map", [](std::ostream& out) { out << map(List<int>{1, 2, 3}, [](int x) { return x + 1; }); }));
    demos.push_back(Demo("Filter", [](std::ostream& out) { out << filter(List<int>{1, 2, 3}, [](int x) { return x > 2; }); }));
    demos.push_back(Demo("FlatMap", [](std::ostream& out) {
        out << flatMap(List<int>{1, 2, 3}, [](int i) { return List<int>{i, i}; });
    }));
    demos.push_back(Demo("Filter via flatMap", [](std::ostream& out) {
        out << filterViaFlatMap(List<int>{1, 2, 3}, [](int x) { return x > 2; });
    }));
    demos.push_back(Demo("Add elements", [](std::ostream& out) { out << addElements(List<int>{1, 2, 3}, List<int>{4, 5, 6}); }));
    demos.push_back(Demo("Zip with", [](std::ostream& out) {
        out << zipWith(List<int>{1, 2, 3}, List<int>{4, 5, 6}, [](int a, int b) { return a * b; });
    }));
    return demos;
}

static std::vector<Demo> treeDemos() {
    const Tree<int> tree = branch(leaf(1), branch(leaf(2), leaf(4)));
    std::vector<Demo> demos;
    demos.push_back(Demo("Tree", [tree](std::ostream& out) { out << tree; }));
    demos.push_back(Demo("Size", [tree](std::ostream& out) { out << size(tree); }));
    demos.push_back(Demo("Depth", [tree](std::ostream& out) { out << depth(tree); }));
    demos.push_back(Demo("Maximum", [tree](std::ostream& out) { out << maximum(tree); }));
    demos.push_back(Demo("Map tree", [tree](std::ostream& out) { out << map(tree, [](int x) { return x + 1; }); }));
    return demos;
}

int main() {
    std::vector<Demo> demos = listDemos();
    std::vector<Demo> trees = treeDemos();
    demos.insert(demos.end(), trees.begin(), trees.end());

    for (const Demo& demo : demos) {
        std::cout << demo.first << ": ";
        demo.second(std::cout);
        std::cout << std::endl;
    }
    return 0;
}
