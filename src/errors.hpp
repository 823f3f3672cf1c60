//
//  errors.hpp
//  nemClear
//

#ifndef errors_hpp
#define errors_hpp

#include <stdexcept>
#include <string>

/* Input that must not reach the model builder: bids exceeding capacity, unknown references, duplicates, negative quantities */
class ValidationError : public std::runtime_error {
public:
	explicit ValidationError (const std::string &msg) : std::runtime_error(msg) {}
};

/* CPLEX failed while building or solving a model */
class SolverError : public std::runtime_error {
public:
	explicit SolverError (const std::string &msg) : std::runtime_error(msg) {}
};

#endif /* errors_hpp */
