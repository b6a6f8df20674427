#ifndef FDS_LIST_HPP
#define FDS_LIST_HPP

#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/variant.hpp>
#include <initializer_list>
#include <ostream>
#include <utility>

#include "errors.hpp"
#include "result_of.hpp"

namespace fds {

// Persistent singly linked list
//
//   List<T> = Nil | Cons(head: T, tail: List<T>)
//
// Cells are immutable once built and tails are shared between lists, so
// copying a list only bumps a reference count. Every operation below walks
// the cells with a loop; none of them needs stack space proportional to the
// length of its input.

struct Nil {};

template <typename T>
struct Cons;

template <typename T>
class List {
public:
    typedef T value_type;
    typedef boost::shared_ptr<Cons<T>> Link;
    typedef boost::variant<Nil, Link> Cell;

    List() : cell_(Nil()) {}
    List(const T& head, const List& tail) : cell_(Link(boost::make_shared<Cons<T>>(head, tail))) {}
    List(std::initializer_list<T> xs);
    List(const List&) = default;
    List(List&&) = default;
    List& operator=(const List&) = default;
    List& operator=(List&&) = default;
    ~List();

    bool isEmpty() const { return node() == nullptr; }

    // The Cons cell, or null for Nil.
    const Cons<T>* node() const {
        const Link* link = boost::get<Link>(&cell_);
        return link ? link->get() : nullptr;
    }

    const Cell& cell() const { return cell_; }

private:
    Cell cell_;
};

template <typename T>
struct Cons {
    Cons(const T& head, const List<T>& tail) : head(head), tail(tail) {}

    T head;
    List<T> tail;
};

template <typename T>
List<T>::List(std::initializer_list<T> xs) : cell_(Nil()) {
    for (auto it = xs.end(); it != xs.begin();) {
        --it;
        *this = List(*it, *this);
    }
}

template <typename T>
List<T>::~List() {
    // Release uniquely owned cells one at a time; a cell still referenced
    // elsewhere stops the walk and keeps the rest of the chain alive.
    Link* link = boost::get<Link>(&cell_);
    if (!link)
        return;
    Link cur;
    cur.swap(*link);
    while (cur && cur.use_count() == 1) {
        Link next;
        if (Link* rest = boost::get<Link>(&cur->tail.cell_))
            next.swap(*rest);
        cur = next;
    }
}

template <typename T>
List<T> nil() {
    return List<T>();
}

template <typename T>
List<T> cons(const T& head, const List<T>& tail) {
    return List<T>(head, tail);
}

template <typename T, typename... Ts>
List<T> listOf(const T& x, const Ts&... xs) {
    return List<T>{x, static_cast<T>(xs)...};
}

template <typename T>
bool operator==(const List<T>& a, const List<T>& b) {
    const Cons<T>* x = a.node();
    const Cons<T>* y = b.node();
    for (; x && y; x = x->tail.node(), y = y->tail.node()) {
        if (x == y)
            return true;
        if (!(x->head == y->head))
            return false;
    }
    return x == y;
}

template <typename T>
bool operator!=(const List<T>& a, const List<T>& b) {
    return !(a == b);
}

namespace detail {

// Prints one cell and yields the list after it, or null at Nil.
template <typename T>
class PrintCell : public boost::static_visitor<const List<T>*> {
public:
    explicit PrintCell(std::ostream& os) : os_(os), first_(true) {}

    const List<T>* operator()(const Nil&) const { return nullptr; }

    const List<T>* operator()(const boost::shared_ptr<Cons<T>>& c) const {
        if (!c)
            return nullptr;
        if (!first_)
            os_ << ", ";
        first_ = false;
        os_ << c->head;
        return &c->tail;
    }

private:
    std::ostream& os_;
    mutable bool first_;
};

} // namespace detail

template <typename T>
std::ostream& operator<<(std::ostream& os, const List<T>& l) {
    detail::PrintCell<T> print(os);
    os << "List(";
    for (const List<T>* cur = &l; cur; cur = boost::apply_visitor(print, cur->cell()))
        ;
    return os << ")";
}

// Folds

template <typename T, typename B, typename F>
B foldLeft(const List<T>& l, B z, F f) {
    for (const Cons<T>* c = l.node(); c; c = c->tail.node())
        z = f(std::move(z), c->head);
    return z;
}

template <typename T>
List<T> reverse(const List<T>& l) {
    return foldLeft(l, List<T>(), [](const List<T>& acc, const T& x) { return List<T>(x, acc); });
}

// f(x1, f(x2, ... f(xn, z))). The combine runs from the last element back to
// the first over a reversed copy of l.
template <typename T, typename B, typename F>
B foldRight(const List<T>& l, B z, F f) {
    const List<T> reversed = reverse(l);
    for (const Cons<T>* c = reversed.node(); c; c = c->tail.node())
        z = f(c->head, std::move(z));
    return z;
}

namespace detail {

// Pushes the elements of rev onto the front of onto, last one first.
template <typename T>
List<T> prependReversed(const List<T>& rev, List<T> onto) {
    for (const Cons<T>* c = rev.node(); c; c = c->tail.node())
        onto = List<T>(c->head, onto);
    return onto;
}

} // namespace detail

// Aggregates

inline int sum(const List<int>& ints) {
    return foldLeft(ints, 0, [](int acc, int x) { return acc + x; });
}

inline int sumViaFoldRight(const List<int>& ints) {
    return foldRight(ints, 0, [](int x, int acc) { return x + acc; });
}

inline double productViaFoldRight(const List<double>& ds) {
    return foldRight(ds, 1.0, [](double x, double acc) { return x * acc; });
}

// head * product(tail), stopping with 0.0 at the first element equal to 0.0.
// The elements before that zero are still multiplied in, right to left.
inline double product(const List<double>& ds) {
    List<double> prefix;
    for (const Cons<double>* c = ds.node(); c; c = c->tail.node()) {
        if (c->head == 0.0)
            return foldLeft(prefix, 0.0, [](double acc, double x) { return x * acc; });
        prefix = List<double>(c->head, prefix);
    }
    return productViaFoldRight(ds);
}

template <typename T>
int length(const List<T>& l) {
    return foldRight(l, 0, [](const T&, int acc) { return acc + 1; });
}

template <typename T>
int lengthViaFoldLeft(const List<T>& l) {
    return foldLeft(l, 0, [](int acc, const T&) { return acc + 1; });
}

// Concatenation. The cells of b are shared with the result.

template <typename T>
List<T> append(const List<T>& a, const List<T>& b) {
    if (a.isEmpty())
        return b;
    return detail::prependReversed(reverse(a), b);
}

template <typename T>
List<T> appendViaFoldLeft(const List<T>& a, const List<T>& b) {
    return foldLeft(reverse(a), b, [](const List<T>& acc, const T& x) { return List<T>(x, acc); });
}

template <typename T>
List<T> appendViaFoldRight(const List<T>& a, const List<T>& b) {
    return foldRight(a, b, [](const T& x, const List<T>& acc) { return List<T>(x, acc); });
}

// Head and prefix manipulation

template <typename T>
List<T> tail(const List<T>& l) {
    const Cons<T>* c = l.node();
    if (!c)
        throw EmptyListError("Can't take tail of empty list");
    return c->tail;
}

// Unlike tail, an empty list is not an error: the result is [h].
template <typename T>
List<T> setHead(const List<T>& l, const typename List<T>::value_type& h) {
    const Cons<T>* c = l.node();
    return List<T>(h, c ? c->tail : List<T>());
}

template <typename T>
List<T> drop(const List<T>& l, int n) {
    const List<T>* rest = &l;
    for (; n > 0 && !rest->isEmpty(); --n)
        rest = &rest->node()->tail;
    return *rest;
}

template <typename T, typename P>
List<T> dropWhile(const List<T>& l, P p) {
    const List<T>* rest = &l;
    while (const Cons<T>* c = rest->node()) {
        if (!p(c->head))
            break;
        rest = &c->tail;
    }
    return *rest;
}

template <typename T>
List<T> init(const List<T>& l) {
    const Cons<T>* c = l.node();
    if (!c || c->tail.isEmpty())
        return List<T>();
    return reverse(drop(reverse(l), 1));
}

// Transformations

template <typename T, typename F>
List<ResultOf<F, const T&>> map(const List<T>& l, F f) {
    typedef ResultOf<F, const T&> U;
    return foldRight(l, List<U>(), [&f](const T& x, const List<U>& acc) { return List<U>(f(x), acc); });
}

template <typename T, typename P>
List<T> filter(const List<T>& l, P include) {
    return foldRight(l, List<T>(), [&include](const T& x, const List<T>& acc) {
        return include(x) ? List<T>(x, acc) : acc;
    });
}

// f must return a List.
template <typename T, typename F>
ResultOf<F, const T&> flatMap(const List<T>& l, F f) {
    typedef ResultOf<F, const T&> Out;
    return foldRight(l, Out(), [&f](const T& x, const Out& acc) { return append(f(x), acc); });
}

template <typename T, typename P>
List<T> filterViaFlatMap(const List<T>& l, P include) {
    return flatMap(l, [&include](const T& x) { return include(x) ? List<T>(x, List<T>()) : List<T>(); });
}

// Pairwise combination, truncated to the shorter input.
template <typename A, typename B, typename F>
List<ResultOf<F, const A&, const B&>> zipWith(const List<A>& a, const List<B>& b, F f) {
    typedef ResultOf<F, const A&, const B&> C;
    List<C> rev;
    const Cons<A>* x = a.node();
    const Cons<B>* y = b.node();
    for (; x && y; x = x->tail.node(), y = y->tail.node())
        rev = List<C>(f(x->head, y->head), rev);
    return reverse(rev);
}

inline List<int> addElements(const List<int>& a, const List<int>& b) {
    return zipWith(a, b, [](int x, int y) { return x + y; });
}

} // namespace fds

#endif
