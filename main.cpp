#include "flat_rbtree.hpp"
#include <iostream>
#include <string>
#include <vector>

struct my_item{
	int key = 0;
	std::string value;
};

static std::ostream& operator<<(std::ostream& os, const my_item* item){
	if(item == nullptr){
		return os << "<none>";
	}
	return os << '{' << item->key << ' ' << item->value << '}';
}

// keyed items, ordered by key only
static void example_keyed_items(){
	auto by_key = [](const my_item& a, const my_item& b){ return a.key <=> b.key; };
	flat_rb::tree<my_item, decltype(by_key)> t(by_key);
	t.insert(my_item{10, "value10"});
	t.insert(my_item{12, "value12"});

	std::cout << "get(10) -> " << t.get(my_item{10, ""}) << '\n';
	std::cout << "get(11) -> " << t.get(my_item{11, ""}) << '\n';

	// find an element >= 11
	auto c = t.find_ge(my_item{11, ""});
	std::cout << "find_ge(11) -> " << &c.item() << '\n';

	// find an element >= 13
	c = t.find_ge(my_item{13, ""});
	std::cout << "find_ge(13) is end: " << std::boolalpha << c.is_end() << '\n';
}

// nearest-neighbor lookups in both directions
static void example_neighbors(){
	flat_rb::tree<int> t;
	for(int v : {40, 10, 30, 20, 50}){
		t.insert(v);
	}
	for(int key : {5, 25, 30, 55}){
		auto ge = t.find_ge(key);
		auto le = t.find_le(key);
		std::cout << "key " << key << ": >= ";
		if(ge.is_end()) std::cout << "end"; else std::cout << ge.item();
		std::cout << ", <= ";
		if(le.is_end()) std::cout << "end"; else std::cout << le.item();
		std::cout << '\n';
	}
}

// forward and backward walks, erasing while iterating
static void example_iteration(){
	flat_rb::tree<int> t;
	for(int i = 1; i <= 10; ++i){
		t.insert(i * i);
	}

	std::cout << "forward:";
	for(int v : t){
		std::cout << ' ' << v;
	}
	std::cout << "\nbackward:";
	for(auto c = t.end(); !c.is_begin();){
		c = c.prev();
		std::cout << ' ' << c.item();
	}

	// drop the odd squares
	for(auto c = t.begin(); !c.is_end();){
		if(c.item() % 2 != 0){
			c = t.erase(c);
		} else{
			c = c.next();
		}
	}
	std::cout << "\neven squares:";
	t.for_each_inorder([](int v){ std::cout << ' ' << v; });
	std::cout << "\nsize " << t.size() << ", free slots " << t.holes() << '\n';
}

int main(){
	example_keyed_items();
	example_neighbors();
	example_iteration();
	return 0;
}
