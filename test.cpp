#include <gtest/gtest.h>

#include "flat_rbtree.hpp"
#include <algorithm>
#include <compare>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using flat_rb::tree;

static_assert(std::bidirectional_iterator<tree<int>::cursor>);

template <class Tree>
static auto inorder_dump(const Tree& t){
    using T = typename Tree::value_type;
    std::vector<T> out;
    t.for_each_inorder([&](const T& v){ out.push_back(v); });
    return out;
}

template <class Tree>
static auto preorder_dump(const Tree& t){
    using T = typename Tree::value_type;
    std::vector<T> out;
    t.for_each_preorder([&](const T& v){ out.push_back(v); });
    return out;
}

template <class T>
static void expect_equal_vec(const std::vector<T>& a, const std::vector<T>& b){
    EXPECT_EQ(a, b);
}

template <class T>
static void expect_strictly_increasing(const std::vector<T>& v){
    for(size_t i = 1; i < v.size(); ++i){
        EXPECT_LT(v[i - 1], v[i]) << "at index " << i;
    }
}

// Walks the tree through its index accessors and checks ordering, parent
// links, root color, red-red edges, black-height, the min/max cache and the
// element count. Returns false if any rule is broken.
template <class Tree, class Cmp = std::compare_three_way>
static bool expect_valid_rb(const Tree& t, Cmp cmp = {}){
    using index_type = typename Tree::index_type;
    const index_type root = t.root_index();
    if(!Tree::is_valid(root)){
        EXPECT_TRUE(t.empty());
        EXPECT_EQ(t.min_index(), Tree::npos);
        EXPECT_EQ(t.max_index(), Tree::npos);
        return t.empty() && t.min_index() == Tree::npos && t.max_index() == Tree::npos;
    }
    bool ok = true;
    if(t.is_red(root)){
        ADD_FAILURE() << "root is red";
        ok = false;
    }
    if(t.parent_of(root) != Tree::npos){
        ADD_FAILURE() << "root has a parent";
        ok = false;
    }

    std::vector<index_type> order;
    // returns the black-height of the subtree at i, counting the null leaves
    auto walk = [&](auto&& self, index_type i) -> int{
        if(!Tree::is_valid(i)) return 1;
        if(t.try_get(i) == nullptr){
            ADD_FAILURE() << "reachable index " << i << " is not a live slot";
            ok = false;
            return 1;
        }
        const index_type l = t.left_of(i);
        const index_type r = t.right_of(i);
        for(index_type c : {l, r}){
            if(!Tree::is_valid(c)) continue;
            if(t.parent_of(c) != i){
                ADD_FAILURE() << "child " << c << " does not point back at " << i;
                ok = false;
            }
            if(t.is_red(i) && t.is_red(c)){
                ADD_FAILURE() << "red-red edge " << i << " -> " << c;
                ok = false;
            }
        }
        const int lh = self(self, l);
        order.push_back(i);
        const int rh = self(self, r);
        if(lh != rh){
            ADD_FAILURE() << "black-height mismatch under " << i << ": " << lh << " vs " << rh;
            ok = false;
        }
        return lh + (t.is_red(i) ? 0 : 1);
    };
    walk(walk, root);

    for(size_t k = 1; k < order.size(); ++k){
        if(!(cmp(t.value_of(order[k - 1]), t.value_of(order[k])) < 0)){
            ADD_FAILURE() << "items out of order at in-order position " << k;
            ok = false;
        }
    }
    if(order.size() != t.size()){
        ADD_FAILURE() << "size() is " << t.size() << " but " << order.size() << " nodes are reachable";
        ok = false;
    }
    if(!order.empty()){
        if(t.min_index() != order.front()){
            ADD_FAILURE() << "cached minimum is stale";
            ok = false;
        }
        if(t.max_index() != order.back()){
            ADD_FAILURE() << "cached maximum is stale";
            ok = false;
        }
    }
    return ok;
}

template <class Tree>
static int height_of(const Tree& t){
    auto h = [&](auto&& self, typename Tree::index_type i) -> int{
        if(!Tree::is_valid(i)) return 0;
        return 1 + std::max(self(self, t.left_of(i)), self(self, t.right_of(i)));
    };
    return h(h, t.root_index());
}

// Test 1 - empty tree has no items and every lookup misses
TEST(FlatRbTree, EmptyTree){
    tree<int> t;
    EXPECT_EQ(t.size(), 0u);
    EXPECT_TRUE(t.empty());
    EXPECT_TRUE(t.find_ge(10).is_end());
    EXPECT_TRUE(t.find_le(10).is_end());
    EXPECT_EQ(t.get(10), nullptr);
    EXPECT_EQ(t.begin(), t.end());
    EXPECT_TRUE(t.end().is_begin());
    EXPECT_TRUE(expect_valid_rb(t));
}

// Test 2 - duplicates rejected, size does not grow, cursor names the existing item
TEST(FlatRbTree, DuplicateInsert){
    tree<int> t;
    auto [c1, ins1] = t.insert(10);
    EXPECT_TRUE(ins1);
    auto [c2, ins2] = t.insert(10);
    EXPECT_FALSE(ins2);
    EXPECT_EQ(c1, c2);
    EXPECT_EQ(t.size(), 1u);
    EXPECT_TRUE(t.contains(10));
    expect_equal_vec(inorder_dump(t), std::vector<int>{10});

    // a rejected duplicate leaves the shape and every lookup alone
    for(int v : {5, 20, 1, 7, 15, 30, 25}) (void)t.insert(v);
    const auto shape = preorder_dump(t);
    const auto root = t.root_index();
    const auto size = t.size();
    for(int v : {10, 1, 25, 7}){
        auto [c, ins] = t.insert(v);
        EXPECT_FALSE(ins) << "duplicate " << v;
        EXPECT_EQ(c.item(), v);
    }
    expect_equal_vec(preorder_dump(t), shape);
    EXPECT_EQ(t.root_index(), root);
    EXPECT_EQ(t.size(), size);
    EXPECT_EQ(t.find_ge(8).item(), 10);
    EXPECT_EQ(t.find_le(8).item(), 7);
    EXPECT_EQ(t.begin().item(), 1);
    EXPECT_EQ(t.end().prev().item(), 30);
    EXPECT_TRUE(expect_valid_rb(t));
}

// Test 3 - find_ge / find_le around a single item
TEST(FlatRbTree, FindGeFindLeSingleItem){
    tree<int> t;
    ASSERT_TRUE(t.insert(10).second);

    EXPECT_EQ(t.find_ge(10).item(), 10);
    EXPECT_TRUE(t.find_ge(11).is_end());
    EXPECT_EQ(t.find_ge(9).item(), 10);

    EXPECT_EQ(t.find_le(10).item(), 10);
    EXPECT_EQ(t.find_le(11).item(), 10);
    EXPECT_TRUE(t.find_le(9).is_end());
}

// Test 4 - get hits only exact items
TEST(FlatRbTree, GetExactOnly){
    tree<int> t;
    ASSERT_TRUE(t.insert(10).second);
    ASSERT_NE(t.get(10), nullptr);
    EXPECT_EQ(*t.get(10), 10);
    EXPECT_EQ(t.get(9), nullptr);
    EXPECT_EQ(t.get(11), nullptr);
}

struct keyed_item{
    int key = 0;
    std::string value;
};

// integer-returning comparator on the key only
struct by_key{
    int operator()(const keyed_item& a, const keyed_item& b) const noexcept{
        return (a.key > b.key) - (a.key < b.key);
    }
};

// Test 5 - keyed items ordered through a comparator that ignores the payload
TEST(FlatRbTree, KeyedItemsWithIntComparator){
    tree<keyed_item, by_key> t;
    ASSERT_TRUE(t.insert(keyed_item{10, "value10"}).second);
    ASSERT_TRUE(t.insert(keyed_item{12, "value12"}).second);

    const keyed_item* hit = t.get(keyed_item{10, ""});
    ASSERT_NE(hit, nullptr);
    EXPECT_EQ(hit->key, 10);
    EXPECT_EQ(hit->value, "value10");

    EXPECT_EQ(t.get(keyed_item{11, ""}), nullptr);

    auto ge = t.find_ge(keyed_item{11, ""});
    ASSERT_FALSE(ge.is_end());
    EXPECT_EQ(ge->key, 12);
    EXPECT_EQ(ge->value, "value12");

    EXPECT_TRUE(t.find_ge(keyed_item{13, ""}).is_end());

    // same key, different payload: still a duplicate
    EXPECT_FALSE(t.insert(keyed_item{12, "other"}).second);
    EXPECT_EQ(t.get(keyed_item{12, ""})->value, "value12");
    EXPECT_TRUE(expect_valid_rb(t, by_key{}));
}

// Test 6 - erase on empty tree misses, erase of the only item empties the tree
TEST(FlatRbTree, EraseByKey){
    tree<int> t;
    EXPECT_FALSE(t.erase(10));
    EXPECT_EQ(t.size(), 0u);

    ASSERT_TRUE(t.insert(10).second);
    EXPECT_TRUE(t.erase(10));
    EXPECT_EQ(t.size(), 0u);
    EXPECT_TRUE(t.begin().is_end());
    EXPECT_TRUE(expect_valid_rb(t));
}

// Test 7 - erase of a missing key between existing items is a no-op
TEST(FlatRbTree, EraseMissingKeyNoOp){
    tree<int> t;
    for(int v : {10, 20, 30}) (void)t.insert(v);

    auto before = preorder_dump(t);
    EXPECT_FALSE(t.erase(15));
    EXPECT_FALSE(t.erase(35));
    EXPECT_EQ(t.size(), 3u);
    expect_equal_vec(preorder_dump(t), before);
}

// Test 8 - rotations on the three-node shapes
TEST(FlatRbTree, InsertRotatesSmallChains){
    tree<int> ascending;
    for(int v : {1, 2, 3}) (void)ascending.insert(v);
    expect_equal_vec(preorder_dump(ascending), std::vector<int>({2, 1, 3}));
    EXPECT_TRUE(expect_valid_rb(ascending));

    tree<int> descending;
    for(int v : {3, 2, 1}) (void)descending.insert(v);
    expect_equal_vec(preorder_dump(descending), std::vector<int>({2, 1, 3}));
    EXPECT_TRUE(expect_valid_rb(descending));

    // zig-zag: 2 is the inner grandchild of 3
    tree<int> zigzag;
    for(int v : {3, 1, 2}) (void)zigzag.insert(v);
    expect_equal_vec(preorder_dump(zigzag), std::vector<int>({2, 1, 3}));
    EXPECT_TRUE(expect_valid_rb(zigzag));

    tree<int> zagzig;
    for(int v : {1, 3, 2}) (void)zagzig.insert(v);
    expect_equal_vec(preorder_dump(zagzig), std::vector<int>({2, 1, 3}));
    EXPECT_TRUE(expect_valid_rb(zagzig));
}

// Test 9 - sorted input stays logarithmic in height
TEST(FlatRbTree, SortedInsertsStayBalanced){
    tree<int> t;
    const int n = 4096;
    for(int i = 0; i < n; ++i){
        ASSERT_TRUE(t.insert(i).second);
    }
    ASSERT_TRUE(expect_valid_rb(t));
    // red-black bound: height <= 2 * log2(n + 1)
    EXPECT_LE(height_of(t), 2 * 13);

    for(int i = 0; i < n; i += 2){
        ASSERT_TRUE(t.erase(i));
    }
    ASSERT_TRUE(expect_valid_rb(t));
    EXPECT_LE(height_of(t), 2 * 12);
    EXPECT_EQ(t.begin().item(), 1);
    EXPECT_EQ(t.end().prev().item(), n - 1);
}

// Test 10 - two-child erase where the predecessor is the left child
TEST(FlatRbTree, EraseTwoChildrenAdjacentPredecessor){
    tree<int> t;
    for(int v : {2, 1, 3}) (void)t.insert(v);
    auto pred = t.find_ge(1);
    auto other = t.find_ge(3);

    EXPECT_TRUE(t.erase(2));
    ASSERT_TRUE(expect_valid_rb(t));
    expect_equal_vec(preorder_dump(t), std::vector<int>({1, 3}));

    // the predecessor node moved up without being copied
    EXPECT_EQ(t.root_index(), pred.index());
    EXPECT_EQ(pred.item(), 1);
    EXPECT_EQ(other.item(), 3);
    EXPECT_EQ(pred.next(), other);
}

// Test 11 - adjacent predecessor that itself has a left child
TEST(FlatRbTree, EraseTwoChildrenAdjacentPredecessorWithChild){
    tree<int> t;
    // 5B(3B(1R), 8B)
    for(int v : {5, 3, 8, 1}) (void)t.insert(v);
    expect_equal_vec(preorder_dump(t), std::vector<int>({5, 3, 1, 8}));
    auto three = t.find_ge(3);

    EXPECT_TRUE(t.erase(5));
    ASSERT_TRUE(expect_valid_rb(t));
    expect_equal_vec(preorder_dump(t), std::vector<int>({3, 1, 8}));
    EXPECT_EQ(t.root_index(), three.index());
    EXPECT_EQ(t.parent_of(t.find_ge(1).index()), three.index());
    EXPECT_EQ(t.parent_of(t.find_ge(8).index()), three.index());
}

// Test 12 - two-child erase where the predecessor is deeper in the left subtree
TEST(FlatRbTree, EraseTwoChildrenDistantPredecessor){
    tree<int> t;
    // 5B(3B(1R, 4R), 8B(7R, 9R))
    for(int v : {5, 3, 8, 1, 4, 7, 9}) (void)t.insert(v);
    expect_equal_vec(preorder_dump(t), std::vector<int>({5, 3, 1, 4, 8, 7, 9}));
    auto four = t.find_ge(4);
    auto three = t.find_ge(3);

    EXPECT_TRUE(t.erase(5));
    ASSERT_TRUE(expect_valid_rb(t));
    expect_equal_vec(preorder_dump(t), std::vector<int>({4, 3, 1, 8, 7, 9}));
    EXPECT_EQ(t.root_index(), four.index());
    EXPECT_EQ(t.left_of(four.index()), three.index());
    EXPECT_EQ(t.right_of(three.index()), tree<int>::npos);
    EXPECT_FALSE(t.is_red(four.index()));
}

// Test 13 - erase every node of a small full tree in each order position
TEST(FlatRbTree, EraseEachPositionFromSmallTrees){
    for(int n = 1; n <= 40; ++n){
        for(int victim = 0; victim < n; ++victim){
            tree<int> t;
            for(int i = 0; i < n; ++i) (void)t.insert(i);
            ASSERT_TRUE(t.erase(victim)) << "n=" << n << " victim=" << victim;
            ASSERT_TRUE(expect_valid_rb(t)) << "n=" << n << " victim=" << victim;
            std::vector<int> expect;
            for(int i = 0; i < n; ++i){
                if(i != victim) expect.push_back(i);
            }
            ASSERT_EQ(inorder_dump(t), expect) << "n=" << n << " victim=" << victim;
        }
    }
}

// Test 14 - cursors walk both directions and the cache reaches the extremes
TEST(FlatRbTree, CursorWalksBothWays){
    tree<int> t;
    for(int v : {50, 20, 80, 10, 30, 70, 90, 60}) (void)t.insert(v);

    std::vector<int> forward;
    for(auto c = t.begin(); !c.is_end(); c = c.next()){
        forward.push_back(c.item());
    }
    expect_equal_vec(forward, std::vector<int>({10, 20, 30, 50, 60, 70, 80, 90}));

    std::vector<int> backward;
    for(auto c = t.end(); !c.is_begin();){
        c = c.prev();
        backward.push_back(c.item());
    }
    expect_equal_vec(backward, std::vector<int>({90, 80, 70, 60, 50, 30, 20, 10}));

    EXPECT_TRUE(t.begin().is_begin());
    EXPECT_EQ(t.begin().item(), 10);
    EXPECT_EQ(t.find_le(1000).item(), 90);
    EXPECT_EQ(t.find_le(55).item(), 50);
    EXPECT_EQ(t.find_ge(55).item(), 60);
    EXPECT_TRUE(t.find_le(5).is_end());
}

// Test 15 - STL-style iteration and algorithms
TEST(FlatRbTree, StlStyleIteration){
    tree<int> t;
    for(int v : {4, 2, 6, 1, 3, 5, 7}) (void)t.insert(v);

    std::vector<int> via_range;
    for(int v : t){
        via_range.push_back(v);
    }
    expect_equal_vec(via_range, std::vector<int>({1, 2, 3, 4, 5, 6, 7}));

    std::vector<int> reversed(std::make_reverse_iterator(t.end()), std::make_reverse_iterator(t.begin()));
    expect_equal_vec(reversed, std::vector<int>({7, 6, 5, 4, 3, 2, 1}));

    EXPECT_EQ(std::distance(t.begin(), t.end()), 7);
    EXPECT_EQ(*std::prev(t.end()), 7);
    EXPECT_TRUE(std::is_sorted(t.begin(), t.end()));

    auto it = t.find_ge(3);
    EXPECT_EQ(*it++, 3);
    EXPECT_EQ(*it, 4);
    EXPECT_EQ(*--it, 3);
}

// Test 16 - precondition violations throw instead of corrupting anything
TEST(FlatRbTree, CursorPreconditionsThrow){
    tree<int>::cursor detached;
    EXPECT_TRUE(detached.is_end());
    EXPECT_TRUE(detached.is_begin());
    EXPECT_THROW((void) detached.item(), std::out_of_range);
    EXPECT_THROW((void) detached.next(), std::out_of_range);
    EXPECT_THROW((void) detached.prev(), std::out_of_range);

    tree<int> t;
    EXPECT_THROW((void) t.erase(detached), std::out_of_range);
    EXPECT_THROW((void) t.end().item(), std::out_of_range);
    EXPECT_THROW((void) t.end().next(), std::out_of_range);
    EXPECT_THROW((void) t.end().prev(), std::out_of_range); // empty: end is also begin
    EXPECT_THROW((void) t.erase(t.end()), std::out_of_range);

    for(int v : {1, 2, 3}) (void)t.insert(v);
    EXPECT_THROW((void) t.begin().prev(), std::out_of_range);
    EXPECT_THROW((void) t.end().next(), std::out_of_range);
    EXPECT_THROW((void) t.erase(t.end()), std::out_of_range);

    tree<int> other;
    (void) other.insert(2);
    EXPECT_THROW((void) t.erase(other.begin()), std::invalid_argument);

    EXPECT_EQ(t.size(), 3u);
    EXPECT_TRUE(expect_valid_rb(t));
}

// Test 17 - erase by cursor returns the successor; stale cursors are rejected
TEST(FlatRbTree, EraseByCursor){
    tree<int> t;
    for(int v : {10, 20, 30, 40, 50}) (void)t.insert(v);

    auto c = t.find_ge(30);
    auto next = t.erase(c);
    ASSERT_FALSE(next.is_end());
    EXPECT_EQ(next.item(), 40);
    EXPECT_FALSE(t.contains(30));
    EXPECT_TRUE(expect_valid_rb(t));

    EXPECT_THROW((void) c.item(), std::out_of_range);
    EXPECT_THROW((void) c.next(), std::out_of_range);
    EXPECT_THROW((void) t.erase(c), std::out_of_range);

    auto last = t.erase(t.find_ge(50));
    EXPECT_TRUE(last.is_end());
    EXPECT_EQ(t.end().prev().item(), 40);

    // erase everything front to back through the returned cursors
    for(auto it = t.begin(); !it.is_end();){
        it = t.erase(it);
        EXPECT_TRUE(expect_valid_rb(t));
    }
    EXPECT_TRUE(t.empty());
}

// Test 18 - cursors survive unrelated erasures, including two-child splices
TEST(FlatRbTree, CursorsStableAcrossErase){
    tree<int> t;
    for(int i = 0; i < 200; ++i) (void)t.insert(i);

    std::vector<tree<int>::cursor> kept;
    for(int i = 1; i < 200; i += 2){
        kept.push_back(t.find_ge(i));
    }
    for(int i = 0; i < 200; i += 2){
        ASSERT_TRUE(t.erase(i));
    }
    ASSERT_TRUE(expect_valid_rb(t));
    int expect = 1;
    for(const auto& c : kept){
        EXPECT_EQ(c.item(), expect);
        expect += 2;
    }
}

// Test 19 - descending order through a custom three-way comparator
TEST(FlatRbTree, CustomComparatorDescendingOrder){
    auto desc = [](int a, int b){ return b <=> a; };
    tree<int, decltype(desc)> t(desc);
    for(int v : {1, 2, 3, 4, 5}) (void)t.insert(v);

    expect_equal_vec(inorder_dump(t), std::vector<int>({5, 4, 3, 2, 1}));
    EXPECT_TRUE(expect_valid_rb(t, desc));
    // "greater or equal" follows the comparator, not operator<
    EXPECT_EQ(t.find_ge(3).item(), 3);
    EXPECT_EQ(t.find_ge(0).is_end(), true);
    EXPECT_EQ(t.find_ge(9).item(), 5);
    EXPECT_EQ(t.find_le(9).is_end(), true);
}

// Test 20 - freed slots are reused before the arena grows
TEST(FlatRbTree, FreedSlotsAreReused){
    tree<int> t;
    t.reserve(8);
    for(int v : {1, 2, 3, 4}) (void)t.insert(v);
    EXPECT_EQ(t.holes(), 0u);

    EXPECT_TRUE(t.erase(2));
    EXPECT_TRUE(t.erase(3));
    EXPECT_EQ(t.holes(), 2u);
    EXPECT_EQ(t.at(t.find_ge(1).index()), 1);

    auto [c, ins] = t.insert(10);
    ASSERT_TRUE(ins);
    EXPECT_EQ(t.holes(), 1u);
    EXPECT_LT(c.index(), 4u);
    EXPECT_EQ(t.at(c.index()), 10);

    EXPECT_THROW((void) t.at(tree<int>::npos), std::out_of_range);
    EXPECT_EQ(t.try_get(tree<int>::npos), nullptr);
    EXPECT_TRUE(expect_valid_rb(t));
}

// Test 21 - clear resets the arena and the tree is usable afterwards
TEST(FlatRbTree, ClearEmpty){
    tree<int> t;
    for(int v : {3, 1, 4}) (void)t.insert(v);
    auto h = t.find_ge(1).index();

    t.clear();
    EXPECT_EQ(t.size(), 0u);
    EXPECT_TRUE(t.empty());
    EXPECT_EQ(t.holes(), 0u);
    EXPECT_EQ(t.try_get(h), nullptr);
    EXPECT_TRUE(expect_valid_rb(t));

    (void) t.insert(2);
    expect_equal_vec(inorder_dump(t), std::vector<int>{2});
    EXPECT_TRUE(expect_valid_rb(t));
}

// Test 22 - swap and copy independence
TEST(FlatRbTree, SwapAndCopyIndependence){
    tree<int> a;
    tree<int> b;
    for(int v : {1, 2, 3}) (void)a.insert(v);
    for(int v : {10, 20}) (void)b.insert(v);

    a.swap(b);
    expect_equal_vec(inorder_dump(a), std::vector<int>({10, 20}));
    expect_equal_vec(inorder_dump(b), std::vector<int>({1, 2, 3}));

    swap(a, b);
    expect_equal_vec(inorder_dump(a), std::vector<int>({1, 2, 3}));

    tree<int> c = a;
    (void) c.insert(4);
    EXPECT_TRUE(c.erase(1));
    EXPECT_TRUE(a.contains(1));
    EXPECT_FALSE(a.contains(4));
    expect_equal_vec(inorder_dump(a), std::vector<int>({1, 2, 3}));
    expect_equal_vec(inorder_dump(c), std::vector<int>({2, 3, 4}));
    EXPECT_TRUE(expect_valid_rb(a));
    EXPECT_TRUE(expect_valid_rb(c));
}

// Test 23 - a moved-from tree is empty and fully usable
TEST(FlatRbTree, MovedFromTreeIsEmptyAndUsable){
    tree<int> a;
    for(int v : {0, 1, 2, 3, 4}) (void)a.insert(v);
    EXPECT_TRUE(a.erase(2));

    tree<int> b = std::move(a);
    expect_equal_vec(inorder_dump(b), std::vector<int>({0, 1, 3, 4}));
    EXPECT_TRUE(expect_valid_rb(b));

    EXPECT_EQ(a.size(), 0u);
    EXPECT_TRUE(a.empty());
    EXPECT_EQ(a.holes(), 0u);
    EXPECT_EQ(a.root_index(), tree<int>::npos);
    EXPECT_TRUE(a.begin().is_end());
    EXPECT_TRUE(a.find_ge(0).is_end());
    EXPECT_FALSE(a.erase(3));
    EXPECT_TRUE(expect_valid_rb(a));

    ASSERT_TRUE(a.insert(42).second);
    EXPECT_EQ(a.size(), 1u);
    EXPECT_EQ(a.find_ge(10).item(), 42);
    EXPECT_TRUE(expect_valid_rb(a));

    // move assignment over a populated tree
    tree<int> c;
    for(int v : {7, 8, 9}) (void)c.insert(v);
    c = std::move(b);
    expect_equal_vec(inorder_dump(c), std::vector<int>({0, 1, 3, 4}));
    EXPECT_TRUE(expect_valid_rb(c));
    EXPECT_EQ(b.size(), 0u);
    EXPECT_TRUE(expect_valid_rb(b));
    ASSERT_TRUE(b.insert(5).second);
    expect_equal_vec(inorder_dump(b), std::vector<int>({5}));
    expect_equal_vec(inorder_dump(a), std::vector<int>({42}));
}

// ------------------------------------------------------------
// Exception-safety + move-only tests

struct ThrowOnMove final{
    int x = 0;
    static inline int moves_left = -1; // -1 = never throw

    explicit ThrowOnMove(int v = 0) noexcept : x(v){}

    ThrowOnMove(const ThrowOnMove&) noexcept = default;
    ThrowOnMove& operator=(const ThrowOnMove&) noexcept = default;

    ThrowOnMove(ThrowOnMove&& other){
        if(moves_left == 0) throw std::runtime_error("ThrowOnMove move");
        if(moves_left > 0) --moves_left;
        x = other.x;
    }
};

struct ThrowOnMoveComp final{
    std::strong_ordering operator()(const ThrowOnMove& a, const ThrowOnMove& b) const noexcept{
        return a.x <=> b.x;
    }
};

template <class Tree>
static std::vector<int> xs_preorder(const Tree& t){
    std::vector<int> xs;
    t.for_each_preorder([&](const ThrowOnMove& v){ xs.push_back(v.x); });
    return xs;
}

// Test 24 - exception safety: failed insert on the append path changes nothing
TEST(FlatRbTree, ExceptionSafetyInsertAppendPath){
    tree<ThrowOnMove, ThrowOnMoveComp> t;
    t.reserve(16);
    for(int v : {5, 2, 8, 1, 9}) (void)t.insert(ThrowOnMove{v});
    const auto shape = xs_preorder(t);
    ASSERT_EQ(t.holes(), 0u);

    ThrowOnMove::moves_left = 0;
    EXPECT_THROW((void) t.insert(ThrowOnMove{4}), std::runtime_error);
    ThrowOnMove::moves_left = -1;

    EXPECT_EQ(t.size(), 5u);
    EXPECT_EQ(t.holes(), 0u);
    EXPECT_FALSE(t.contains(ThrowOnMove{4}));
    expect_equal_vec(xs_preorder(t), shape);
    EXPECT_TRUE(expect_valid_rb(t, ThrowOnMoveComp{}));

    ASSERT_TRUE(t.insert(ThrowOnMove{4}).second);
    EXPECT_EQ(t.size(), 6u);
    EXPECT_TRUE(expect_valid_rb(t, ThrowOnMoveComp{}));
}

// Test 25 - exception safety: failed insert into freed slot restores free list
TEST(FlatRbTree, ExceptionSafetyInsertIntoFreedSlotRestoresFreeList){
    tree<ThrowOnMove, ThrowOnMoveComp> t;
    for(int v : {1, 2, 3, 4, 5}) (void)t.insert(ThrowOnMove{v});

    EXPECT_TRUE(t.erase(ThrowOnMove{2}));
    EXPECT_EQ(t.size(), 4u);
    EXPECT_EQ(t.holes(), 1u);
    const auto shape = xs_preorder(t);

    // next insert will try to reuse the freed slot
    ThrowOnMove::moves_left = 0;
    EXPECT_THROW((void) t.insert(ThrowOnMove{42}), std::runtime_error);
    ThrowOnMove::moves_left = -1;

    EXPECT_EQ(t.size(), 4u);
    EXPECT_EQ(t.holes(), 1u);
    EXPECT_FALSE(t.contains(ThrowOnMove{42}));
    expect_equal_vec(xs_preorder(t), shape);
    EXPECT_TRUE(expect_valid_rb(t, ThrowOnMoveComp{}));

    auto [c, ins] = t.insert(ThrowOnMove{2});
    ASSERT_TRUE(ins);
    EXPECT_EQ(c->x, 2);
    EXPECT_EQ(t.holes(), 0u);
    EXPECT_EQ(t.size(), 5u);

    std::vector<int> xs;
    t.for_each_inorder([&](const ThrowOnMove& v){ xs.push_back(v.x); });
    expect_equal_vec(xs, std::vector<int>({1, 2, 3, 4, 5}));
    EXPECT_TRUE(expect_valid_rb(t, ThrowOnMoveComp{}));
}

// Move-only type to ensure insert(value_type&&) works and comparisons don't require copies
struct MoveOnly final{
    int x = 0;
    explicit MoveOnly(int v = 0) noexcept : x(v){}

    MoveOnly(const MoveOnly&) = delete;
    MoveOnly& operator=(const MoveOnly&) = delete;

    MoveOnly(MoveOnly&&) noexcept = default;
    MoveOnly& operator=(MoveOnly&&) noexcept = default;
};

struct MoveOnlyComp final{
    std::strong_ordering operator()(const MoveOnly& a, const MoveOnly& b) const noexcept{
        return a.x <=> b.x;
    }
};

// Test 26 - move-only values: insert/emplace/contains/erase still work
TEST(FlatRbTree, MoveOnlyValues){
    tree<MoveOnly, MoveOnlyComp> t;
    for(int v : {5, 2, 8, 1, 9, 3}){
        ASSERT_TRUE(t.insert(MoveOnly{v}).second);
    }
    ASSERT_TRUE(t.emplace(7).second);
    EXPECT_FALSE(t.emplace(7).second);

    EXPECT_TRUE(t.contains(MoveOnly{2}));
    EXPECT_FALSE(t.contains(MoveOnly{4}));

    EXPECT_TRUE(t.erase(MoveOnly{5}));
    EXPECT_FALSE(t.contains(MoveOnly{5}));

    std::vector<int> xs;
    t.for_each_inorder([&](const MoveOnly& v){ xs.push_back(v.x); });
    expect_equal_vec(xs, std::vector<int>({1, 2, 3, 7, 8, 9}));
    EXPECT_TRUE(expect_valid_rb(t, MoveOnlyComp{}));
}

// Test 27 - narrow index type still works and reports the same npos everywhere
TEST(FlatRbTree, NarrowIndexType){
    tree<int, std::compare_three_way, uint16_t> t;
    for(int i = 0; i < 1000; ++i) (void)t.insert(i * 7 % 1000);
    EXPECT_EQ(t.size(), 1000u);
    EXPECT_TRUE(expect_valid_rb(t));
    EXPECT_EQ(t.end().index(), (tree<int, std::compare_three_way, uint16_t>::npos));
    EXPECT_EQ(t.begin().item(), 0);
    EXPECT_EQ(t.end().prev().item(), 999);
}

//
// Randomized model test against a sorted std::vector
//

// Position in the sorted oracle; index == data.size() is end.
struct oracle_cursor{
    const std::vector<int>* data;
    size_t index;
    bool is_end() const{ return index >= data->size(); }
    bool is_begin() const{ return index == 0; }
    int item() const{ return (*data)[index]; }
};

static oracle_cursor oracle_find_ge(const std::vector<int>& data, int key){
    auto it = std::lower_bound(data.begin(), data.end(), key);
    return {&data, static_cast<size_t>(it - data.begin())};
}

static oracle_cursor oracle_find_le(const std::vector<int>& data, int key){
    oracle_cursor c = oracle_find_ge(data, key);
    if(!c.is_end() && c.item() == key) return c;
    if(c.index == 0) return {&data, data.size()};
    return {&data, c.index - 1};
}

// Walk forward to end and backward to begin from the same start in both
// structures and require identical sequences.
static void compare_contents(oracle_cursor start, tree<int>::cursor tstart, int step){
    oracle_cursor oi = start;
    auto ti = tstart;
    while(!oi.is_end() && !ti.is_end()){
        ASSERT_EQ(ti.item(), oi.item()) << "forward, step " << step;
        ++oi.index;
        ti = ti.next();
    }
    ASSERT_TRUE(ti.is_end()) << "tree has extra items, step " << step;
    ASSERT_TRUE(oi.is_end()) << "tree is missing items, step " << step;

    oi = start;
    ti = tstart;
    while(!oi.is_begin() && !ti.is_begin()){
        if(oi.is_end()){
            ASSERT_TRUE(ti.is_end()) << "backward end mismatch, step " << step;
        } else{
            ASSERT_EQ(ti.item(), oi.item()) << "backward, step " << step;
        }
        --oi.index;
        ti = ti.prev();
    }
    ASSERT_TRUE(ti.is_begin()) << "tree did not reach begin, step " << step;
    ASSERT_TRUE(oi.is_begin()) << "tree reached begin early, step " << step;
}

static void run_model_test(unsigned seed, int num_keys, int steps){
    std::vector<int> oracle;
    tree<int> t;
    size_t inserted = 0;
    size_t erased = 0;
    std::mt19937 rng(seed);
    auto rand_below = [&](int n){ return std::uniform_int_distribution<int>(0, n - 1)(rng); };

    for(int step = 0; step < steps; ++step){
        const int op = rand_below(100);
        if(op < 50){
            const int key = rand_below(num_keys);
            auto pos = std::lower_bound(oracle.begin(), oracle.end(), key);
            const bool fresh = pos == oracle.end() || *pos != key;
            if(fresh){
                oracle.insert(pos, key);
            }
            ASSERT_EQ(t.insert(key).second, fresh) << "insert " << key << ", step " << step;
            inserted += fresh ? 1 : 0;
            ASSERT_TRUE(expect_valid_rb(t)) << "after insert " << key << ", step " << step;
            compare_contents(oracle_find_ge(oracle, -1), t.find_ge(-1), step);
        } else if(op < 90 && !oracle.empty()){
            const int key = oracle[static_cast<size_t>(rand_below(static_cast<int>(oracle.size())))];
            oracle.erase(std::lower_bound(oracle.begin(), oracle.end(), key));
            ASSERT_TRUE(t.erase(key)) << "erase " << key << ", step " << step;
            ++erased;
            ASSERT_TRUE(expect_valid_rb(t)) << "after erase " << key << ", step " << step;
            compare_contents(oracle_find_ge(oracle, -1), t.find_ge(-1), step);
        } else if(op < 95){
            const int key = rand_below(num_keys);
            compare_contents(oracle_find_ge(oracle, key), t.find_ge(key), step);
        } else{
            const int key = rand_below(num_keys);
            compare_contents(oracle_find_le(oracle, key), t.find_le(key), step);
        }
        ASSERT_EQ(t.size(), inserted - erased);
        ASSERT_EQ(t.size(), oracle.size());
        if(::testing::Test::HasFatalFailure()) return;
    }
}

// Test 28 - random interleavings over a wide key space
TEST(FlatRbTree, RandomizedAgainstSortedVector){
    run_model_test(0, 1000, 10000);
}

// Test 29 - random interleavings over a tiny key space, so two-child
// erasures keep hitting small subtrees where the predecessor is adjacent
TEST(FlatRbTree, RandomizedSmallKeySpace){
    for(unsigned seed = 1; seed <= 20; ++seed){
        run_model_test(seed, 12, 500);
        if(HasFatalFailure()) return;
    }
}
