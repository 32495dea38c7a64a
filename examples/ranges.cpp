#include <Exrange/Exrange.hpp>
using namespace ex;

#include <iostream>
#include <vector>

int main()
{
	//All values in (1, 5]. The range is its own cursor, iterating consumes it
	RangeFromExclusiveToInclusive<int> r{1, 5};
	std::cout << r << " has " << r.len() << " elements:";
	for(int v : r)
		std::cout << " " << v;
	std::cout << std::endl;

	//Iterating backwards, (1, 5)
	RangeFromExclusiveToExclusive<int> q{1, 5};
	std::cout << q << " backwards:";
	for(auto it = q.rbegin(); it != q.rend(); ++it)
		std::cout << " " << *it;
	std::cout << std::endl;

	//Bounds
	RangeFromExclusive<int> from{10};
	std::cout << from << " starts at " << from.startBound() << " and ends at " << from.endBound() << std::endl;
	std::cout << "Contains 10: " << std::boolalpha << from.contains(10) << ", contains 11: " << from.contains(11) << std::endl;

	//Indexing. (1, 3] selects the elements at index 2 and 3
	std::vector<int> v = {0, 10, 20, 30, 40};
	std::cout << slice(v, RangeFromExclusiveToInclusive<size_t>{1, 3}) << std::endl;

	try {
		slice(v, RangeFromExclusive<size_t>{5});
	}
	catch(const IndexError& e) {
		std::cout << "Error: " << e.what() << std::endl;
	}
}
