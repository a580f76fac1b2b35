#pragma once

// Arduino entry points; the sketch forwards setup()/loop() here.
void appSetup();
void appLoop();
