#include <ranger/error.hpp>
#include <ranger/range_complement.hpp>
#include <ranger/range_formatter.hpp>
#include <ranger/range_parser.hpp>
#include <ranger/range_tupleizer.hpp>
#include <ranger/token.hpp>

#include <boost/leaf.hpp>

#include <iostream>
#include <string>
#include <string_view>

namespace
{
    int usage()
    {
        std::cerr << "usage: ranger-range-tool normalize <ranges>\n"
                  << "       ranger-range-tool complement <ranges> [start [end]]\n"
                  << "       ranger-range-tool tuples <ranges>\n";
        return 2;
    }

    boost::leaf::result<void> run(std::string_view command, int argc, char** argv)
    {
        std::string_view const ranges = argv[2];
        if (command == "normalize")
        {
            BOOST_LEAF_AUTO(integers, Ranger::parseIntegerList(ranges));
            std::cout << Ranger::formatIntegerList(integers) << "\n";
        }
        else if (command == "complement")
        {
            Ranger::ComplementBounds bounds{};
            if (argc > 3)
            {
                BOOST_LEAF_AUTO(start, Ranger::parseInteger(argv[3]));
                bounds.start = start;
            }
            if (argc > 4)
            {
                BOOST_LEAF_AUTO(end, Ranger::parseInteger(argv[4]));
                bounds.end = end;
            }
            BOOST_LEAF_AUTO(complement, Ranger::complementIntegerList(ranges, bounds));
            std::cout << complement << "\n";
        }
        else if (command == "tuples")
        {
            BOOST_LEAF_AUTO(pairs, Ranger::boundPairsFromIntegerList(ranges));
            for (auto const& pair : pairs)
                std::cout << pair << "\n";
        }
        return {};
    }
}

int main(int argc, char** argv)
{
    if (argc < 3)
        return usage();

    const std::string_view command = argv[1];
    if (command != "normalize" && command != "complement" && command != "tuples")
        return usage();

    return boost::leaf::try_handle_all(
        [&]() -> boost::leaf::result<int> {
            BOOST_LEAF_CHECK(run(command, argc, argv));
            return 0;
        },
        [](Ranger::MalformedToken const& error) {
            std::cerr << error << "\n";
            return 1;
        },
        [](Ranger::InvalidNotation const& error) {
            std::cerr << error << "\n";
            return 1;
        },
        [](boost::leaf::error_info const& info) {
            std::cerr << "Unexpected error " << info.error() << "\n";
            return 1;
        });
}
