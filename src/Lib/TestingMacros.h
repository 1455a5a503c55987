//
// Accessors that are only compiled into the test build
//

#ifndef TELESTORE_RELAY_TESTINGMACROS_H
#define TELESTORE_RELAY_TESTINGMACROS_H

#ifdef BUILD_TESTS
// NOLINTBEGIN
#define EXPOSE_PROPERTY_FOR_TESTING_READONLY(term) public: auto get##term () { return &term; }
#define EXPOSE_FUNCTION_FOR_TESTING_ONE_PARAM(term, param) public: auto call##term (param value) { return term(value); }
// NOLINTEND
#else
#define EXPOSE_PROPERTY_FOR_TESTING_READONLY(x)
#define EXPOSE_FUNCTION_FOR_TESTING_ONE_PARAM(x, y)
#endif

#endif //TELESTORE_RELAY_TESTINGMACROS_H
