#include <iostream>
#include <map>
#include <string>

typedef std::map<std::string, int(*)(int, char**)> SubCmdMap;
#define _(x) extern int x##_main(int, char**)
#define __(x) {#x, &x##_main}

 _(distribution);  _(formula);  _(precursor);  _(db);

const SubCmdMap subcommands{
__(distribution), __(formula), __(precursor), __(db)
};

#undef _
#undef __

int main(int argc, char** argv) {
	if (argc == 1) {
		std::cout << "Usage: isodist <subcommand> [options...]\n"
							<< "The following subcommands are available:\n"
							<< "    distribution - averagine isotope distributions for given masses\n"
							<< "    formula      - averagine elemental composition for given masses\n"
							<< "    precursor    - neutral precursor mass from m/z and charge\n"
							<< "    db           - builds a distribution database for a list of masses\n"
							<< "\n"
							<< "To get help for a subcommand, run it without any options."
							<< std::endl;
		return 0;
	}

	auto it = subcommands.find(argv[1]);
	if (it == subcommands.end()) {
		std::cout << "Unknown subcommand '" << argv[1] << "'" << std::endl;
		return -1;
	}

	return it->second(argc - 1, argv + 1);
}
