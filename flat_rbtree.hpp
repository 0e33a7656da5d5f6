// flat_rb::tree<T, Compare, IndexT>: a flat, index-based red-black tree
// Stores nodes in a std::vector and links them by integer indices (parent, left,
// right) for better cache locality, fewer allocations and stable handles.
// Erased slots go on a free list and are reused by later inserts.
// Compare is a three-way comparator: comp(a, b) < 0, == 0 or > 0, the default
// being a <=> b. Lookup, insert and erase are O(log n); cursors walk parent
// links, so iteration needs no auxiliary stack.
// Requires C++20. See main.cpp for usage examples.
#pragma once
#include <cassert>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <limits>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

// forward declare the class template so the cursor can name it
namespace flat_rb {
	template<class T, class Compare = std::compare_three_way, class IndexT = uint32_t>
	class tree;
};

//namespace for the cursor implementation
namespace flat_rb::detail {
	template<class T, class Compare, class IndexT>
	class cursor{
		using tree_t = tree<T, Compare, IndexT>;
		using index_type = IndexT;
		static constexpr index_type npos = std::numeric_limits<index_type>::max();

		const tree_t* tree_ = nullptr;
		index_type cur_ = npos;

		// only the tree hands out cursors
		friend tree_t;
		constexpr cursor(const tree_t* t, index_type i) noexcept : tree_(t), cur_(i){}

	public:
		using value_type = T;
		using reference = const T&;
		using pointer = const T*;
		using difference_type = std::ptrdiff_t;
		using iterator_category = std::bidirectional_iterator_tag;

		constexpr cursor() = default;

		// past the maximum element
		[[nodiscard]] constexpr bool is_end() const noexcept{ return cur_ == npos; }

		// at the minimum element. An end cursor on an empty tree is also begin.
		[[nodiscard]] constexpr bool is_begin() const noexcept{
			return tree_ == nullptr || cur_ == tree_->min_index();
		}

		[[nodiscard]] constexpr index_type index() const noexcept{ return cur_; }
		[[nodiscard]] constexpr const tree_t* owner() const noexcept{ return tree_; }

		// REQUIRES: !is_end() and the node has not been erased
		[[nodiscard]] constexpr reference item() const{
			if(is_end()){
				throw std::out_of_range("flat_rb::cursor::item on end cursor");
			}
			const T* p = tree_->try_get(cur_);
			if(p == nullptr){
				throw std::out_of_range("flat_rb::cursor::item on erased node");
			}
			return *p;
		}

		// successor of the current node; the maximum steps to end
		// REQUIRES: !is_end()
		[[nodiscard]] constexpr cursor next() const{
			if(is_end()){
				throw std::out_of_range("flat_rb::cursor::next on end cursor");
			}
			check_live();
			return cursor(tree_, tree_->successor_of(cur_));
		}

		// predecessor of the current node; end steps back to the maximum
		// REQUIRES: !is_begin()
		[[nodiscard]] constexpr cursor prev() const{
			if(is_begin()){
				throw std::out_of_range("flat_rb::cursor::prev on begin cursor");
			}
			if(is_end()){
				return cursor(tree_, tree_->max_index());
			}
			check_live();
			return cursor(tree_, tree_->predecessor_of(cur_));
		}

		constexpr reference operator*() const{ return item(); }
		constexpr pointer operator->() const{ return &item(); }

		constexpr cursor& operator++(){
			*this = next();
			return *this;
		}
		constexpr cursor operator++(int){
			auto tmp = *this;
			++(*this);
			return tmp;
		}
		constexpr cursor& operator--(){
			*this = prev();
			return *this;
		}
		constexpr cursor operator--(int){
			auto tmp = *this;
			--(*this);
			return tmp;
		}

		friend constexpr bool operator==(const cursor& a, const cursor& b) noexcept{
			return a.tree_ == b.tree_ && a.cur_ == b.cur_;
		}

	private:
		constexpr void check_live() const{
			if(tree_->try_get(cur_) == nullptr){
				throw std::out_of_range("flat_rb::cursor used after its node was erased");
			}
		}
	};
} // namespace flat_rb::detail

namespace flat_rb{

	template<class T, class Compare, class IndexT>
	class tree final{
	public:
		using cursor = flat_rb::detail::cursor<T, Compare, IndexT>;
		using const_iterator = cursor;
		using iterator = cursor;
		using value_type = T;
		using size_type = std::size_t;
		using index_type = IndexT;
		using compare_type = Compare;

		static_assert(std::is_unsigned_v<index_type>, "IndexT must be an unsigned integer type");
		static constexpr index_type npos = std::numeric_limits<index_type>::max();

		tree() = default;

		constexpr explicit tree(Compare cmp) noexcept : comp_(std::move(cmp)){}

		tree(const tree&) = default;
		tree& operator=(const tree&) = default;

		// the source is left empty but usable
		constexpr tree(tree&& other) noexcept
			: root_(std::exchange(other.root_, npos))
			, min_(std::exchange(other.min_, npos))
			, max_(std::exchange(other.max_, npos))
			, alive_(std::exchange(other.alive_, size_type(0)))
			, nodes_(std::move(other.nodes_))
			, free_(std::move(other.free_))
			, comp_(other.comp_){
			other.nodes_.clear();
			other.free_.clear();
		}

		constexpr tree& operator=(tree&& other) noexcept{
			if(this != &other){
				root_ = std::exchange(other.root_, npos);
				min_ = std::exchange(other.min_, npos);
				max_ = std::exchange(other.max_, npos);
				alive_ = std::exchange(other.alive_, size_type(0));
				nodes_ = std::move(other.nodes_);
				free_ = std::move(other.free_);
				comp_ = other.comp_;
				other.nodes_.clear();
				other.free_.clear();
			}
			return *this;
		}

		[[nodiscard]] constexpr size_type size() const noexcept{ return alive_; }
		[[nodiscard]] constexpr size_type holes() const noexcept{ return free_.size(); }
		[[nodiscard]] constexpr size_type capacity() const noexcept{ return nodes_.capacity(); }
		[[nodiscard]] constexpr bool empty() const noexcept{ return alive_ == 0; }

		//accessors for the cursor and for invariant checks.
		//they bloat the public API a bit, but I don't have to deal with friend classes so...
		[[nodiscard]] inline constexpr index_type root_index() const noexcept{ return root_; }
		[[nodiscard]] inline constexpr index_type min_index() const noexcept{ return min_; }
		[[nodiscard]] inline constexpr index_type max_index() const noexcept{ return max_; }
		static inline constexpr bool is_valid(index_type i) noexcept{ return i != npos; }
		[[nodiscard]] inline constexpr index_type left_of(index_type i)   const noexcept{ return node_ref(i).left; }
		[[nodiscard]] inline constexpr index_type right_of(index_type i)  const noexcept{ return node_ref(i).right; }
		[[nodiscard]] inline constexpr index_type parent_of(index_type i) const noexcept{ return node_ref(i).parent; }
		[[nodiscard]] inline constexpr bool is_red(index_type i) const noexcept{ return color_of(i) == color::red; }
		[[nodiscard]] inline constexpr const value_type& value_of(index_type i) const noexcept{ return node_ref(i).value; }

		// minimum node greater than i, or npos
		[[nodiscard]] constexpr index_type successor_of(index_type i) const noexcept{
			const node& n = node_ref(i);
			if(is_valid(n.right)){
				return leftmost_from(n.right);
			}
			index_type child = i;
			index_type p = n.parent;
			while(is_valid(p) && node_ref(p).right == child){
				child = p;
				p = node_ref(p).parent;
			}
			return p;
		}

		// maximum node smaller than i, or npos
		[[nodiscard]] constexpr index_type predecessor_of(index_type i) const noexcept{
			const node& n = node_ref(i);
			if(is_valid(n.left)){
				return rightmost_from(n.left);
			}
			index_type child = i;
			index_type p = n.parent;
			while(is_valid(p) && node_ref(p).left == child){
				child = p;
				p = node_ref(p).parent;
			}
			return p;
		}

		// returns pointer to value or nullptr for npos and erased slots
		[[nodiscard]] inline constexpr const value_type* try_get(index_type i) const noexcept{
			if(is_valid(i) && i < nodes_.size() && nodes_[i].has_value()){
				return &nodes_[i]->value;
			}
			return nullptr;
		}

		[[nodiscard]] constexpr const value_type& at(index_type i) const{
			const value_type* p = try_get(i);
			if(p == nullptr){
				throw std::out_of_range("flat_rb::tree::at invalid index");
			}
			return *p;
		}

		constexpr void reserve(size_type n){ nodes_.reserve(n); }

		constexpr void clear(){
			nodes_.clear();
			free_.clear();
			root_ = npos;
			min_ = npos;
			max_ = npos;
			alive_ = 0;
		}

		constexpr void swap(tree& other) noexcept{
			using std::swap;
			swap(nodes_, other.nodes_);
			swap(free_, other.free_);
			swap(root_, other.root_);
			swap(min_, other.min_);
			swap(max_, other.max_);
			swap(alive_, other.alive_);
			swap(comp_, other.comp_);
		}
		friend constexpr void swap(tree& a, tree& b) noexcept{ a.swap(b); }

		// insert / emplace, returns {cursor, inserted}. On a duplicate the
		// cursor points at the item already in the tree.
		constexpr std::pair<cursor, bool> insert(const value_type& v){
			return insert_impl(v);
		}
		constexpr std::pair<cursor, bool> insert(value_type&& v){
			return insert_impl(std::move(v));
		}
		template<class... Args>
		constexpr std::pair<cursor, bool> emplace(Args&&... args){
			value_type temp(std::forward<Args>(args)...);
			return insert_impl(std::move(temp));
		}

		[[nodiscard]] constexpr bool contains(const value_type& key) const{
			return find_ge_impl(key).second;
		}

		// the item equal to key, or nullptr
		[[nodiscard]] constexpr const value_type* get(const value_type& key) const{
			auto [idx, exact] = find_ge_impl(key);
			return exact ? &value_of(idx) : nullptr;
		}

		// smallest item >= key, or end
		[[nodiscard]] constexpr cursor find_ge(const value_type& key) const{
			return cursor(this, find_ge_impl(key).first);
		}

		// largest item <= key, or end
		[[nodiscard]] constexpr cursor find_le(const value_type& key) const{
			auto [idx, exact] = find_ge_impl(key);
			if(exact){
				return cursor(this, idx);
			}
			if(is_valid(idx)){
				return cursor(this, predecessor_of(idx));
			}
			return cursor(this, max_); // key is above every item
		}

		// erase by key - returns true if erased
		constexpr bool erase(const value_type& key){
			auto [idx, exact] = find_ge_impl(key);
			if(!exact){
				return false;
			}
			erase_at(idx);
			return true;
		}

		// erase the item under the cursor, returns a cursor to its successor
		// REQUIRES: !pos.is_end()
		constexpr cursor erase(cursor pos){
			if(pos.is_end()){
				throw std::out_of_range("flat_rb::tree::erase on end cursor");
			}
			if(pos.owner() != this){
				throw std::invalid_argument("flat_rb::tree::erase cursor belongs to another tree");
			}
			if(try_get(pos.index()) == nullptr){
				throw std::out_of_range("flat_rb::tree::erase cursor to an erased node");
			}
			const index_type succ = successor_of(pos.index());
			erase_at(pos.index());
			return cursor(this, succ); // node indices survive the splice
		}

		// traversals. Callback recieves const T&
		template<class F>
		constexpr void for_each_inorder(F&& f) const{
			for(index_type i = min_; is_valid(i); i = successor_of(i)){
				f(value_of(i));
			}
		}

		template<class F>
		constexpr void for_each_preorder(F&& f) const{
			if(!is_valid(root_)) return;
			std::vector<index_type> stack;
			stack.reserve(64);
			stack.push_back(root_);
			while(!stack.empty()){
				index_type index = stack.back();
				stack.pop_back();
				f(value_of(index));
				const node& n = node_ref(index);
				if(is_valid(n.right)){
					stack.push_back(n.right);
				}
				if(is_valid(n.left)){
					stack.push_back(n.left);
				}
			}
		}

		inline constexpr cursor begin() const noexcept{ return cursor(this, min_); }
		inline constexpr cursor end()   const noexcept{ return cursor(this, npos); }

	private:
		enum class color : uint8_t{ red, black };

		struct node final{
			value_type value;
			index_type parent = npos;
			index_type left = npos;
			index_type right = npos;
			color paint = color::red;
			constexpr explicit node(const value_type& v) : value(v){}
			constexpr explicit node(value_type&& v) noexcept(std::is_nothrow_move_constructible_v<value_type>) : value(std::move(v)){}
		};
		index_type root_ = npos;
		index_type min_ = npos;
		index_type max_ = npos;
		size_type alive_ = 0;
		std::vector<std::optional<node>> nodes_;
		std::vector<index_type> free_;
		[[no_unique_address]] Compare comp_{};

		template<class V>
		constexpr index_type make_node(V&& v){
			if(!free_.empty()){ //can we re-use a free slot?
				index_type idx = free_.back();
				nodes_[idx].emplace(std::forward<V>(v)); // construct before popping
				free_.pop_back();
				++alive_;
				return idx;
			}
			// no free slots available, let's append (grow). npos stays reserved.
			index_type idx = static_cast<index_type>(nodes_.size());
			if(nodes_.size() >= size_type(npos)){
				throw std::length_error("flat_rb::tree index overflow!");
			}
			nodes_.emplace_back(std::in_place, std::forward<V>(v)); // may throw, but no state updated yet
			++alive_;
			return idx;
		}

		constexpr void tombstone(index_type idx) noexcept{
			assert(is_valid(idx) && idx < nodes_.size() && nodes_[idx].has_value());
			nodes_[idx].reset();
			free_.push_back(idx);
			--alive_;
		}

		constexpr node& node_ref(index_type idx) noexcept{
			assert(is_valid(idx) && idx < nodes_.size() && nodes_[idx].has_value());
			return *nodes_[idx];
		}
		constexpr const node& node_ref(index_type idx) const noexcept{
			assert(is_valid(idx) && idx < nodes_.size() && nodes_[idx].has_value());
			return *nodes_[idx];
		}

		// absent children count as black
		constexpr color color_of(index_type idx) const noexcept{
			return is_valid(idx) ? node_ref(idx).paint : color::black;
		}

		constexpr bool is_left_child(index_type idx) const noexcept{
			return node_ref(node_ref(idx).parent).left == idx;
		}

		constexpr index_type sibling_of(index_type idx) const noexcept{
			const node& p = node_ref(node_ref(idx).parent);
			return p.left == idx ? p.right : p.left;
		}

		constexpr index_type leftmost_from(index_type idx) const noexcept{
			while(is_valid(node_ref(idx).left)){
				idx = node_ref(idx).left;
			}
			return idx;
		}

		constexpr index_type rightmost_from(index_type idx) const noexcept{
			while(is_valid(node_ref(idx).right)){
				idx = node_ref(idx).right;
			}
			return idx;
		}

		// smallest node >= key and whether it compares equal
		constexpr std::pair<index_type, bool> find_ge_impl(const value_type& key) const{
			index_type cur = root_;
			while(is_valid(cur)){
				const node& n = node_ref(cur);
				const auto c = comp_(key, n.value);
				if(c == 0){
					return {cur, true};
				}
				if(c < 0){
					if(!is_valid(n.left)){
						return {cur, false};
					}
					cur = n.left;
				} else{
					if(!is_valid(n.right)){
						index_type succ = successor_of(cur);
						if(!is_valid(succ)){
							return {npos, false}; // key is above every item
						}
						return {succ, comp_(key, node_ref(succ).value) == 0};
					}
					cur = n.right;
				}
			}
			return {npos, false};
		}

		// point whatever linked to old_child (parent slot or root) at new_child
		constexpr void replace_node(index_type old_child, index_type new_child) noexcept{
			const index_type parent = node_ref(old_child).parent;
			if(!is_valid(parent)){
				root_ = new_child;
			} else{
				node& p = node_ref(parent);
				if(p.left == old_child){
					p.left = new_child;
				} else{
					assert(p.right == old_child && "parent does not point to old_child");
					p.right = new_child;
				}
			}
			if(is_valid(new_child)){
				node_ref(new_child).parent = parent;
			}
		}

		/*
		    X               Y
		  A   Y     =>    X   C
		     B C         A B
		*/
		constexpr void rotate_left(index_type x) noexcept{
			const index_type y = node_ref(x).right;
			assert(is_valid(y));
			const index_type b = node_ref(y).left;
			node_ref(x).right = b;
			if(is_valid(b)){
				node_ref(b).parent = x;
			}
			replace_node(x, y);
			node_ref(y).left = x;
			node_ref(x).parent = y;
		}

		/*
		      Y           X
		    X   C  =>   A   Y
		   A B             B C
		*/
		constexpr void rotate_right(index_type y) noexcept{
			const index_type x = node_ref(y).left;
			assert(is_valid(x));
			const index_type b = node_ref(x).right;
			node_ref(y).left = b;
			if(is_valid(b)){
				node_ref(b).parent = y;
			}
			replace_node(y, x);
			node_ref(x).right = y;
			node_ref(y).parent = x;
		}

		// unique-key insert: plain BST descent, then recolor/rotate upwards
		template<class V>
		constexpr std::pair<cursor, bool> insert_impl(V&& v){
			if(!is_valid(root_)){
				root_ = make_node(std::forward<V>(v));
				node_ref(root_).paint = color::black;
				min_ = max_ = root_;
				return {cursor(this, root_), true};
			}
			index_type parent = root_;
			bool go_left = false;
			while(true){
				const node& n = node_ref(parent);
				const auto c = comp_(v, n.value);
				if(c == 0){ // reject duplicate
					return {cursor(this, parent), false};
				}
				go_left = c < 0;
				const index_type next = go_left ? n.left : n.right;
				if(!is_valid(next)){
					break;
				}
				parent = next;
			}
			// make_node may grow nodes_, so take no node references before this
			const index_type idx = make_node(std::forward<V>(v));
			node_ref(idx).parent = parent;
			if(go_left){
				node_ref(parent).left = idx;
				if(parent == min_){
					min_ = idx;
				}
			} else{
				node_ref(parent).right = idx;
				if(parent == max_){
					max_ = idx;
				}
			}
			insert_fixup(idx);
			return {cursor(this, idx), true};
		}

		constexpr void insert_fixup(index_type n) noexcept{
			while(true){
				// root: paint black
				if(!is_valid(node_ref(n).parent)){
					node_ref(n).paint = color::black;
					return;
				}
				index_type parent = node_ref(n).parent;
				// black parent: nothing is violated
				if(node_ref(parent).paint == color::black){
					return;
				}
				// a red parent is never the root, so the grandparent exists
				const index_type grandparent = node_ref(parent).parent;
				assert(is_valid(grandparent));
				const bool parent_is_left = node_ref(grandparent).left == parent;
				const index_type uncle = parent_is_left ? node_ref(grandparent).right : node_ref(grandparent).left;

				// red uncle: push the red up to the grandparent
				if(color_of(uncle) == color::red){
					node_ref(parent).paint = color::black;
					node_ref(uncle).paint = color::black;
					node_ref(grandparent).paint = color::red;
					n = grandparent;
					continue;
				}

				// inner grandchild: rotate it to the outside first
				const bool n_is_left = node_ref(parent).left == n;
				if(n_is_left != parent_is_left){
					if(parent_is_left){
						rotate_left(parent);
					} else{
						rotate_right(parent);
					}
					n = parent;
					continue;
				}

				// outer grandchild, black uncle
				node_ref(parent).paint = color::black;
				node_ref(grandparent).paint = color::red;
				if(n_is_left){
					rotate_right(grandparent);
				} else{
					rotate_left(grandparent);
				}
				return;
			}
		}

		// Put n where its in-order predecessor was and vice versa, exchanging
		// colors and every link, so n ends up with at most one child. Values
		// never move: cursors to the predecessor stay valid.
		constexpr void swap_with_predecessor(index_type n) noexcept{
			const index_type n_left = node_ref(n).left;
			const index_type n_right = node_ref(n).right;
			assert(is_valid(n_left) && is_valid(n_right));
			const index_type pred = rightmost_from(n_left);
			const index_type pred_parent = node_ref(pred).parent;
			const index_type pred_left = node_ref(pred).left;
			const color pred_color = node_ref(pred).paint;

			replace_node(n, pred);
			node_ref(pred).paint = node_ref(n).paint;
			node_ref(pred).right = n_right;
			node_ref(n_right).parent = pred;

			if(pred_parent == n){
				// pred was n's left child: n drops into pred's old slot below it
				node_ref(pred).left = n;
				node_ref(n).parent = pred;
			} else{
				// pred was the right child of something deeper in n's left subtree
				node_ref(pred).left = n_left;
				node_ref(n_left).parent = pred;
				node_ref(pred_parent).right = n;
				node_ref(n).parent = pred_parent;
			}
			node_ref(n).left = pred_left;
			if(is_valid(pred_left)){
				node_ref(pred_left).parent = n;
			}
			node_ref(n).right = npos;
			node_ref(n).paint = pred_color;
		}

		// erase at specific index
		constexpr void erase_at(index_type n){
			// growing the free list is the only step that may throw; keep it ahead of any relinking
			if(free_.size() == free_.capacity()){
				free_.reserve(free_.capacity() < 8 ? 8 : free_.capacity() * 2);
			}
			if(min_ == n){
				min_ = npos;
			}
			if(max_ == n){
				max_ = npos;
			}
			if(is_valid(node_ref(n).left) && is_valid(node_ref(n).right)){
				swap_with_predecessor(n);
			}
			assert(!is_valid(node_ref(n).left) || !is_valid(node_ref(n).right));
			const index_type child = is_valid(node_ref(n).left) ? node_ref(n).left : node_ref(n).right;

			// removing a black node shortens its paths; rebalance while n is still linked
			if(node_ref(n).paint == color::black){
				erase_fixup(n);
			}
			replace_node(n, child);
			if(!is_valid(node_ref(n).parent) && is_valid(child)){
				node_ref(child).paint = color::black;
			}
			tombstone(n);

			if(alive_ > 0){
				if(!is_valid(min_)){
					min_ = leftmost_from(root_);
				}
				if(!is_valid(max_)){
					max_ = rightmost_from(root_);
				}
			}
		}

		constexpr void erase_fixup(index_type n) noexcept{
			while(is_valid(node_ref(n).parent)){
				index_type parent = node_ref(n).parent;
				index_type sibling = sibling_of(n);
				// a black n has a non-empty sibling subtree of equal black-height
				assert(is_valid(sibling));

				// case 1: red sibling, rotate so n gets a black one
				if(node_ref(sibling).paint == color::red){
					node_ref(parent).paint = color::red;
					node_ref(sibling).paint = color::black;
					if(is_left_child(n)){
						rotate_left(parent);
					} else{
						rotate_right(parent);
					}
					sibling = sibling_of(n);
				}

				const bool nephews_black = color_of(node_ref(sibling).left) == color::black &&
					color_of(node_ref(sibling).right) == color::black;

				// case 2: all black around n, push the deficit up
				if(node_ref(parent).paint == color::black && node_ref(sibling).paint == color::black && nephews_black){
					node_ref(sibling).paint = color::red;
					n = parent;
					continue;
				}

				// case 3/4: red parent, black sibling and nephews
				if(node_ref(parent).paint == color::red && node_ref(sibling).paint == color::black && nephews_black){
					node_ref(sibling).paint = color::red;
					node_ref(parent).paint = color::black;
					return;
				}

				erase_fixup_rotate(n);
				return;
			}
		}

		// cases 5 and 6 of the erase fixup: a red nephew lends n a black
		constexpr void erase_fixup_rotate(index_type n) noexcept{
			const bool n_is_left = is_left_child(n);
			index_type sibling = sibling_of(n);

			// case 5: near nephew red, far nephew black, rotate it outward
			if(n_is_left && node_ref(sibling).paint == color::black &&
				color_of(node_ref(sibling).left) == color::red && color_of(node_ref(sibling).right) == color::black){
				node_ref(sibling).paint = color::red;
				node_ref(node_ref(sibling).left).paint = color::black;
				rotate_right(sibling);
			} else if(!n_is_left && node_ref(sibling).paint == color::black &&
				color_of(node_ref(sibling).right) == color::red && color_of(node_ref(sibling).left) == color::black){
				node_ref(sibling).paint = color::red;
				node_ref(node_ref(sibling).right).paint = color::black;
				rotate_left(sibling);
			}

			// case 6: far nephew red
			const index_type parent = node_ref(n).parent;
			sibling = sibling_of(n);
			node_ref(sibling).paint = node_ref(parent).paint;
			node_ref(parent).paint = color::black;
			if(n_is_left){
				assert(color_of(node_ref(sibling).right) == color::red);
				node_ref(node_ref(sibling).right).paint = color::black;
				rotate_left(parent);
			} else{
				assert(color_of(node_ref(sibling).left) == color::red);
				node_ref(node_ref(sibling).left).paint = color::black;
				rotate_right(parent);
			}
		}
	};
} // namespace flat_rb
