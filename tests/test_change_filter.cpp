/*
 * File: tests/test_change_filter.cpp
 * Project: Print Telemetry Bridge
 * Purpose: Change filter tolerances
 * Notes:
 *  - Snapshot and status files are only ever replaced via include/atomic_write.hpp
 *  - A change must be strictly greater than its tolerance
 * Last updated: 2026-10-16
 */

#include <catch2/catch_all.hpp>
#include "bridge_filter.hpp"


TEST_CASE("first record is always published"){
ChangeFilter f; PrintRecord r;
REQUIRE(f.differs(r)); REQUIRE(f.should_publish(r)); REQUIRE(f.last_published().has_value());
}

TEST_CASE("nozzle jitter within tolerance is suppressed"){
ChangeFilter f; PrintRecord a; a.nozzle_temp=210.40;
REQUIRE(f.should_publish(a));
PrintRecord b=a; b.nozzle_temp=210.42;
REQUIRE_FALSE(f.should_publish(b));
REQUIRE(f.last_published()->nozzle_temp==210.40);
}

TEST_CASE("a single field past its tolerance publishes"){
PrintRecord base; base.progress=10; base.layer=5; base.total_layers=50; base.elapsed=100; base.remaining=100;
base.nozzle_temp=200; base.bed_temp=60; base.used_filament=10; base.filename="a.gcode";
ChangeTolerances t;

auto check=[&](auto mutate, bool expect){
    PrintRecord c=base; mutate(c);
    REQUIRE(differs_beyond(c, base, t)==expect);
};
check([](PrintRecord& c){ c.progress+=0.5; }, false);
check([](PrintRecord& c){ c.progress+=0.6; }, true);
check([](PrintRecord& c){ c.layer+=1; }, true);
check([](PrintRecord& c){ c.total_layers+=1; }, true);
check([](PrintRecord& c){ c.elapsed+=1; }, false);
check([](PrintRecord& c){ c.elapsed+=2; }, true);
check([](PrintRecord& c){ c.remaining-=2; }, true);
check([](PrintRecord& c){ c.bed_temp-=0.4; }, false);
check([](PrintRecord& c){ c.bed_temp-=0.6; }, true);
check([](PrintRecord& c){ c.used_filament+=1.5; }, true);
check([](PrintRecord& c){ c.filename="b.gcode"; }, true);
check([](PrintRecord& c){ c.image_url="/local/ender_v3ke/print.png"; }, true);
}

TEST_CASE("slow drift publishes once it accumulates past tolerance"){
ChangeFilter f; PrintRecord r; r.nozzle_temp=200;
REQUIRE(f.should_publish(r));
int published=0;
for(int i=1;i<=10;++i){ r.nozzle_temp=200+0.2*i; if(f.should_publish(r)) ++published; }
// compared against the last published value, not the previous frame
REQUIRE(published==3);
}

TEST_CASE("reset forgets the last published record"){
ChangeFilter f; PrintRecord r;
REQUIRE(f.should_publish(r)); REQUIRE_FALSE(f.should_publish(r));
f.reset();
REQUIRE(f.should_publish(r));
}

TEST_CASE("zero tolerances publish any change"){
ChangeTolerances t; t.progress=0; t.temperature=0; t.time=0; t.filament=0;
ChangeFilter f(t); PrintRecord r;
REQUIRE(f.should_publish(r));
r.used_filament=0.01;
REQUIRE(f.should_publish(r));
REQUIRE_FALSE(f.should_publish(r));
}
