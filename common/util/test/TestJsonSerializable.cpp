/**
 * @file TestJsonSerializable.cpp
 *
 * @copyright Copyright (c) 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 */

#include <boost/test/unit_test.hpp>
#include "JsonSerializable.h"
#include <sstream>



BOOST_AUTO_TEST_CASE(JsonSerializableTestCase)
{
    static const std::string jsonTextStr(
    "{"
        "\"mybool1\":true,"
        "\"mybool2\":false,"
        "\"mystr\":\"test\","
        "\"myint\":-3,\"myuint\"  :  10,"
        "\"myeid\":    \"ipn:1.0\""
    "}\n");

    {
        boost::property_tree::ptree pt;
        BOOST_REQUIRE(JsonSerializable::GetPropertyTreeFromJsonString(jsonTextStr, pt));
        BOOST_REQUIRE_EQUAL(pt.get<bool>("mybool1", false), true);
        BOOST_REQUIRE_EQUAL(pt.get<bool>("mybool2", true), false);
        BOOST_REQUIRE_EQUAL(pt.get<std::string>("mystr", ""), "test");
        BOOST_REQUIRE_EQUAL(pt.get<int>("myint", 100), -3);
        BOOST_REQUIRE_EQUAL(pt.get<unsigned int>("myuint", 100), 10);
        BOOST_REQUIRE_EQUAL(pt.get<std::string>("myeid", ""), "ipn:1.0");

        //numbers and booleans are written back without quotes, strings keep them
        const std::string compact = JsonSerializable::PtToJsonString(pt, false);
        BOOST_REQUIRE(compact.find("\"mybool1\":true") != std::string::npos);
        BOOST_REQUIRE(compact.find("\"myint\":-3") != std::string::npos);
        BOOST_REQUIRE(compact.find("\"myuint\":10") != std::string::npos);
        BOOST_REQUIRE(compact.find("\"mystr\":\"test\"") != std::string::npos);
    }

    //test GetAllJsonKeys regex, a precondition to finding unused keys
    {
        std::set<std::string> jsonKeys; //support out of order
        JsonSerializable::GetAllJsonKeys(jsonTextStr, jsonKeys);
        BOOST_REQUIRE(jsonKeys == std::set<std::string>({ "mybool1", "mybool2", "mystr", "myint", "myuint", "myeid" }));
        //test without having to load entire file
        std::set<std::string> jsonKeys2;
        std::istringstream iss(jsonTextStr);
        JsonSerializable::GetAllJsonKeysLineByLine(iss, jsonKeys2);
        BOOST_REQUIRE(jsonKeys == jsonKeys2);
    }

    {
        boost::property_tree::ptree pt;
        BOOST_REQUIRE(!JsonSerializable::GetPropertyTreeFromJsonString("{\"unterminated\": ", pt));
        BOOST_REQUIRE(!JsonSerializable::GetPropertyTreeFromJsonFilePath("this_file_does_not_exist.json", pt));
    }
}
